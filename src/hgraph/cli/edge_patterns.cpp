#include "hgraph/cli/edge_patterns.h"

namespace hgraph {
namespace cli {

namespace {

using EdgeList = core::Result<std::vector<core::EdgeKey>>;

EdgeList too_few(const char* pattern, size_t needed) {
    return EdgeList::error(core::Error::Code::INVALID_ARGUMENT,
                           std::string("A ") + pattern + " needs at least " +
                           std::to_string(needed) + " vertices");
}

} // namespace

EdgeList chain_edges(const std::vector<core::VertexId>& vertices) {
    if (vertices.size() < 2) {
        return too_few("chain", 2);
    }
    std::vector<core::EdgeKey> edges;
    for (size_t i = 0; i + 1 < vertices.size(); ++i) {
        edges.emplace_back(vertices[i], vertices[i + 1]);
    }
    return EdgeList(std::move(edges));
}

EdgeList cycle_edges(const std::vector<core::VertexId>& vertices) {
    if (vertices.empty()) {
        return too_few("cycle", 1);
    }
    std::vector<core::VertexId> closed(vertices);
    closed.push_back(vertices.front());
    std::vector<core::EdgeKey> edges;
    for (size_t i = 0; i + 1 < closed.size(); ++i) {
        edges.emplace_back(closed[i], closed[i + 1]);
    }
    return EdgeList(std::move(edges));
}

EdgeList star_edges(const std::vector<core::VertexId>& vertices) {
    if (vertices.size() < 2) {
        return too_few("star", 2);
    }
    std::vector<core::EdgeKey> edges;
    for (size_t i = 1; i < vertices.size(); ++i) {
        edges.emplace_back(vertices[0], vertices[i]);
    }
    return EdgeList(std::move(edges));
}

EdgeList clique_edges(const std::vector<core::VertexId>& vertices) {
    if (vertices.size() < 2) {
        return too_few("clique", 2);
    }
    std::vector<core::EdgeKey> edges;
    for (size_t i = 0; i < vertices.size(); ++i) {
        for (size_t j = 0; j < vertices.size(); ++j) {
            if (i != j) {
                edges.emplace_back(vertices[i], vertices[j]);
            }
        }
    }
    return EdgeList(std::move(edges));
}

std::vector<core::EdgeKey> reversed(std::vector<core::EdgeKey> edges) {
    for (auto& edge : edges) {
        std::swap(edge.first, edge.second);
    }
    return edges;
}

} // namespace cli
} // namespace hgraph
