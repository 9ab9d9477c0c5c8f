#ifndef HGRAPH_CORE_TYPES_H_
#define HGRAPH_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hgraph {
namespace core {

using VertexId = uint64_t;
using Weight = uint32_t;
using Score = int64_t;

/// Directed edge key (from, to).
using EdgeKey = std::pair<VertexId, VertexId>;

/// Vertex id 0 is never a valid vertex.
constexpr VertexId kInvalidVertex = 0;
constexpr Weight kDefaultWeight = 1;

/**
 * @brief Kind of a graph mutation recorded in the command log
 *
 * The numeric values are part of the on-disk record format.
 */
enum class CommandType : uint8_t {
    ADD_VERTEX = 1,
    ADD_EDGE = 2,
    REMOVE_VERTEX = 3,
    REMOVE_EDGE = 4
};

/**
 * @brief One graph mutation
 *
 * Vertex commands use only `a`; edge commands use `a` as the source and
 * `b` as the target. `weight` is meaningful for ADD_EDGE only.
 */
struct Command {
    CommandType type;
    VertexId a;
    VertexId b;
    Weight weight;

    Command() : type(CommandType::ADD_VERTEX), a(kInvalidVertex), b(kInvalidVertex), weight(0) {}

    static Command AddVertex(VertexId id) {
        Command cmd;
        cmd.type = CommandType::ADD_VERTEX;
        cmd.a = id;
        return cmd;
    }

    static Command AddEdge(VertexId from, VertexId to, Weight weight = kDefaultWeight) {
        Command cmd;
        cmd.type = CommandType::ADD_EDGE;
        cmd.a = from;
        cmd.b = to;
        cmd.weight = weight;
        return cmd;
    }

    static Command RemoveVertex(VertexId id) {
        Command cmd;
        cmd.type = CommandType::REMOVE_VERTEX;
        cmd.a = id;
        return cmd;
    }

    static Command RemoveEdge(VertexId from, VertexId to) {
        Command cmd;
        cmd.type = CommandType::REMOVE_EDGE;
        cmd.a = from;
        cmd.b = to;
        return cmd;
    }

    bool is_edge_command() const {
        return type == CommandType::ADD_EDGE || type == CommandType::REMOVE_EDGE;
    }

    bool operator==(const Command& other) const {
        return type == other.type && a == other.a && b == other.b && weight == other.weight;
    }
    bool operator!=(const Command& other) const { return !(*this == other); }
};

/**
 * @brief A path or closed cycle returned by a search
 *
 * For paths `length` is the number of vertices in `vertices`. For cycles
 * `vertices` is a closed walk (first == last) and `length` is the number
 * of distinct vertices, which equals the number of edges.
 */
struct PathResult {
    std::vector<VertexId> vertices;
    size_t length;
    Score score;

    PathResult() : length(0), score(0) {}
    PathResult(std::vector<VertexId> v, size_t len, Score s)
        : vertices(std::move(v)), length(len), score(s) {}

    bool operator==(const PathResult& other) const {
        return vertices == other.vertices && length == other.length && score == other.score;
    }
    bool operator!=(const PathResult& other) const { return !(*this == other); }
};

std::string to_string(CommandType type);
std::string to_string(const std::vector<VertexId>& vertices);

} // namespace core
} // namespace hgraph

#endif // HGRAPH_CORE_TYPES_H_
