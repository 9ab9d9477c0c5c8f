#include "hgraph/constraint/checker.h"

#include <map>
#include <set>

namespace hgraph {
namespace constraint {

namespace {

core::Result<void> violation(const std::string& message) {
    return core::Result<void>::error(core::Error::Code::INTERNAL, message);
}

/// Sums edge weights along `walk`; nullopt if an edge is missing.
std::optional<core::Score> walk_score(const storage::Graph& graph,
                                      const std::vector<core::VertexId>& walk) {
    core::Score score = 0;
    for (size_t i = 1; i < walk.size(); ++i) {
        auto weight = graph.edge_weight(walk[i - 1], walk[i]);
        if (!weight) {
            return std::nullopt;
        }
        score += *weight;
    }
    return score;
}

core::Result<void> check_common(const storage::Graph& graph,
                                const core::PathResult& result,
                                const ConstraintSet& cs,
                                size_t length) {
    auto score = walk_score(graph, result.vertices);
    if (!score) {
        return violation("Result " + core::to_string(result.vertices) + " uses a missing edge");
    }
    if (*score != result.score) {
        return violation("Reported score " + std::to_string(result.score) +
                         " differs from the edge weight sum " + std::to_string(*score));
    }
    if (length != result.length) {
        return violation("Reported length " + std::to_string(result.length) +
                         " differs from the actual length " + std::to_string(length));
    }

    std::set<core::VertexId> seen(result.vertices.begin(), result.vertices.end());
    for (auto id : cs.include_vertices) {
        if (!seen.count(id)) {
            return violation("Included vertex " + std::to_string(id) + " is missing");
        }
    }
    for (auto id : cs.exclude_vertices) {
        if (seen.count(id)) {
            return violation("Excluded vertex " + std::to_string(id) + " is present");
        }
    }
    for (size_t i = 1; i < result.vertices.size(); ++i) {
        if (cs.excludes(result.vertices[i - 1], result.vertices[i])) {
            return violation("Excluded edge (" + std::to_string(result.vertices[i - 1]) + ", " +
                             std::to_string(result.vertices[i]) + ") is present");
        }
    }

    auto min_len = cs.length_floor();
    auto max_len = cs.length_ceiling();
    if ((min_len && length < *min_len) || (max_len && length > *max_len)) {
        return violation("Length " + std::to_string(length) + " is out of bounds");
    }
    auto min_score = cs.score_floor();
    auto max_score = cs.score_ceiling();
    if ((min_score && *score < *min_score) || (max_score && *score > *max_score)) {
        return violation("Score " + std::to_string(*score) + " is out of bounds");
    }
    return core::Result<void>();
}

} // namespace

bool respects_order(const std::vector<core::VertexId>& walk,
                    const std::vector<core::VertexId>& ordered) {
    std::map<core::VertexId, size_t> position;
    for (size_t i = 0; i < ordered.size(); ++i) {
        position.emplace(ordered[i], i);
    }
    size_t reached = 0;
    for (auto id : walk) {
        auto it = position.find(id);
        if (it == position.end()) {
            continue;
        }
        if (it->second < reached) {
            return false;
        }
        reached = it->second;
    }
    return true;
}

core::Result<void> check_path(const storage::Graph& graph,
                              const core::PathResult& path,
                              const ConstraintSet& cs,
                              core::VertexId start,
                              core::VertexId end) {
    const auto& walk = path.vertices;
    if (walk.empty() || walk.front() != start || walk.back() != end) {
        return violation("Path " + core::to_string(walk) + " does not run from " +
                         std::to_string(start) + " to " + std::to_string(end));
    }

    auto common = check_common(graph, path, cs, walk.size());
    if (!common.ok()) {
        return common;
    }

    std::set<core::VertexId> seen(walk.begin(), walk.end());
    for (auto id : cs.ordered_vertices) {
        if (!seen.count(id)) {
            return violation("Ordered vertex " + std::to_string(id) + " is missing");
        }
    }
    if (!respects_order(walk, cs.ordered_vertices)) {
        return violation("Path " + core::to_string(walk) + " breaks the vertex order");
    }

    bool has_cycle = seen.size() < walk.size();
    if (cs.require_cycle && !has_cycle) {
        return violation("Path " + core::to_string(walk) + " contains no cycle");
    }
    if (cs.forbid_cycle && has_cycle) {
        return violation("Path " + core::to_string(walk) + " contains a cycle");
    }
    return core::Result<void>();
}

core::Result<void> check_cycle(const storage::Graph& graph,
                               const core::PathResult& cycle,
                               const ConstraintSet& cs) {
    const auto& walk = cycle.vertices;
    if (walk.size() < 2 || walk.front() != walk.back()) {
        return violation("Cycle " + core::to_string(walk) + " is not a closed walk");
    }
    std::set<core::VertexId> distinct(walk.begin(), walk.end() - 1);
    if (distinct.size() != walk.size() - 1) {
        return violation("Cycle " + core::to_string(walk) + " repeats a vertex");
    }

    auto common = check_common(graph, cycle, cs, distinct.size());
    if (!common.ok()) {
        return common;
    }

    std::set<core::EdgeKey> used;
    for (size_t i = 1; i < walk.size(); ++i) {
        used.emplace(walk[i - 1], walk[i]);
    }
    for (const auto& edge : cs.include_edges) {
        if (!used.count(edge)) {
            return violation("Included edge (" + std::to_string(edge.first) + ", " +
                             std::to_string(edge.second) + ") is missing");
        }
    }
    return core::Result<void>();
}

} // namespace constraint
} // namespace hgraph
