#include "hgraph/core/types.h"

#include <sstream>

namespace hgraph {
namespace core {

std::string to_string(CommandType type) {
    switch (type) {
        case CommandType::ADD_VERTEX: return "AddVertex";
        case CommandType::ADD_EDGE: return "AddEdge";
        case CommandType::REMOVE_VERTEX: return "RemoveVertex";
        case CommandType::REMOVE_EDGE: return "RemoveEdge";
    }
    return "Unknown";
}

std::string to_string(const std::vector<VertexId>& vertices) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < vertices.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << vertices[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace core
} // namespace hgraph
