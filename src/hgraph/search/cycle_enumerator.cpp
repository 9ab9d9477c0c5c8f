#include "hgraph/search/cycle_enumerator.h"

#include <algorithm>
#include <deque>
#include <limits>
#include <unordered_map>

#include "hgraph/common/logger.h"
#include "hgraph/constraint/checker.h"

namespace hgraph {
namespace search {

namespace {

constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

struct Frame {
    core::VertexId vertex;
    storage::Graph::Adjacency::const_iterator next;
    storage::Graph::Adjacency::const_iterator end;
};

core::PathResult make_cycle(const std::vector<core::VertexId>& open_path, core::Score score) {
    std::vector<core::VertexId> closed(open_path);
    closed.push_back(open_path.front());
    return core::PathResult(std::move(closed), open_path.size(), score);
}

} // namespace

CycleEnumerator::CycleEnumerator(const storage::Graph& graph, core::SearchConfig config)
    : graph_(graph), config_(config) {}

std::vector<core::VertexId> CycleEnumerator::canonical_rotation(const std::vector<core::VertexId>& cycle) {
    if (cycle.size() < 2) {
        return cycle;
    }
    std::vector<core::VertexId> open(cycle.begin(), cycle.end() - 1);
    std::rotate(open.begin(), std::min_element(open.begin(), open.end()), open.end());
    open.push_back(open.front());
    return open;
}

core::Result<void> CycleEnumerator::tick() {
    if (config_.cancel && config_.cancel->load()) {
        return core::Result<void>::error(core::Error::Code::SEARCH_ABORTED, "Search cancelled");
    }
    if (config_.max_expansions > 0 && stats_.expansions >= config_.max_expansions) {
        return core::Result<void>::error(core::Error::Code::SEARCH_ABORTED,
                                         "Search exceeded " + std::to_string(config_.max_expansions) +
                                         " expansions");
    }
    ++stats_.expansions;
    return core::Result<void>();
}

core::Result<void> CycleEnumerator::validate(const CycleRequest& request,
                                             const constraint::ConstraintSet& constraints) const {
    if (std::holds_alternative<Girth>(request)) {
        if (!constraints.empty()) {
            return core::Result<void>::error(core::Error::Code::INVALID_CONSTRAINT,
                                             "Girth queries accept no constraints");
        }
        return core::Result<void>();
    }
    if (const auto* take = std::get_if<TakeCycles>(&request)) {
        if (take->n == 0) {
            return core::Result<void>::error(core::Error::Code::INVALID_CONSTRAINT,
                                             "take-n requires n > 0");
        }
    }
    return constraint::validate_cycle_constraints(constraints, graph_);
}

core::Result<CycleQueryResult> CycleEnumerator::run(const CycleRequest& request,
                                                    const constraint::ConstraintSet& constraints) {
    stats_ = SearchStats();
    auto valid = validate(request, constraints);
    if (!valid.ok()) {
        return core::Result<CycleQueryResult>::propagate(valid);
    }
    HGRAPH_DEBUG("Cycle query '{}' with {}", request_name(request), constraints.describe());

    if (std::holds_alternative<Girth>(request)) {
        return girth();
    }
    if (std::holds_alternative<HamiltonianCycle>(request)) {
        return hamiltonian(constraints);
    }

    CycleQueryResult result;
    size_t cap = kUnbounded;
    Visitor visitor;

    if (std::holds_alternative<CountCycles>(request)) {
        visitor = [&result](const std::vector<core::VertexId>&, core::Score) {
            ++result.count;
            return true;
        };
    } else if (std::holds_alternative<AllCycles>(request)) {
        visitor = [&result](const std::vector<core::VertexId>& path, core::Score score) {
            result.cycles.push_back(make_cycle(path, score));
            return true;
        };
    } else if (std::holds_alternative<HeadCycle>(request) ||
               std::holds_alternative<TakeCycles>(request)) {
        size_t limit = 1;
        if (const auto* take = std::get_if<TakeCycles>(&request)) {
            limit = take->n;
        }
        visitor = [&result, limit](const std::vector<core::VertexId>& path, core::Score score) {
            result.cycles.push_back(make_cycle(path, score));
            return result.cycles.size() < limit;
        };
    } else {
        // Shortest or longest: keep the first best cycle in discovery order.
        const bool shortest = std::holds_alternative<ShortestCycle>(request);
        visitor = [&result, &cap, shortest](const std::vector<core::VertexId>& path, core::Score score) {
            size_t length = path.size();
            bool better = result.cycles.empty();
            if (!better) {
                const auto& best = result.cycles.front();
                better = shortest ? (length < best.length || (length == best.length && score < best.score))
                                  : (length > best.length || (length == best.length && score < best.score));
            }
            if (better) {
                result.cycles.assign(1, make_cycle(path, score));
                if (shortest) {
                    cap = length;
                }
            }
            return true;
        };
    }

    auto enumerated = enumerate(constraints, cap, visitor);
    if (!enumerated.ok()) {
        return core::Result<CycleQueryResult>::propagate(enumerated);
    }

    if (!std::holds_alternative<CountCycles>(request)) {
        for (const auto& cycle : result.cycles) {
            auto checked = constraint::check_cycle(graph_, cycle, constraints);
            if (!checked.ok()) {
                return core::Result<CycleQueryResult>::propagate(checked);
            }
        }
        result.count = result.cycles.size();
    }
    HGRAPH_DEBUG("Cycle query '{}' produced {} cycle(s) after {} expansions",
                 request_name(request), result.count, stats_.expansions);
    return core::Result<CycleQueryResult>(std::move(result));
}

core::Result<void> CycleEnumerator::enumerate(const constraint::ConstraintSet& cs,
                                              const size_t& depth_cap,
                                              const Visitor& visitor) {
    const auto length_floor = cs.length_floor();
    const auto length_ceiling = cs.length_ceiling();
    const auto score_floor = cs.score_floor();
    const auto score_ceiling = cs.score_ceiling();
    const core::Score min_weight = graph_.min_edge_weight().value_or(0);

    // A canonical cycle starts at its minimum vertex, so no start above the
    // smallest mandatory vertex can produce a satisfying cycle.
    std::optional<core::VertexId> start_limit;
    for (auto id : cs.include_vertices) {
        start_limit = start_limit ? std::min(*start_limit, id) : id;
    }
    for (const auto& edge : cs.include_edges) {
        auto low = std::min(edge.first, edge.second);
        start_limit = start_limit ? std::min(*start_limit, low) : low;
    }

    std::vector<core::VertexId> path;
    std::vector<core::Score> scores;
    std::unordered_map<core::VertexId, size_t> position;
    std::vector<Frame> stack;

    auto accepts = [&](core::Score score) {
        size_t length = path.size();
        if ((length_floor && length < *length_floor) || (length_ceiling && length > *length_ceiling)) {
            return false;
        }
        if ((score_floor && score < *score_floor) || (score_ceiling && score > *score_ceiling)) {
            return false;
        }
        for (auto id : cs.include_vertices) {
            if (!position.count(id)) {
                return false;
            }
        }
        for (const auto& edge : cs.include_edges) {
            auto it = position.find(edge.first);
            if (it == position.end()) {
                return false;
            }
            core::VertexId successor = it->second + 1 < path.size() ? path[it->second + 1] : path.front();
            if (successor != edge.second) {
                return false;
            }
        }
        return true;
    };

    for (auto start : graph_.vertices()) {
        if (start_limit && start > *start_limit) {
            break;
        }
        if (cs.excludes(start)) {
            continue;
        }

        path.assign(1, start);
        scores.assign(1, 0);
        position.clear();
        position.emplace(start, 0);
        const auto& adjacency = graph_.successors(start);
        stack.push_back(Frame{start, adjacency.begin(), adjacency.end()});

        while (!stack.empty()) {
            Frame& frame = stack.back();
            if (frame.next == frame.end) {
                position.erase(frame.vertex);
                path.pop_back();
                scores.pop_back();
                stack.pop_back();
                continue;
            }

            const core::VertexId from = frame.vertex;
            const core::VertexId to = frame.next->first;
            const core::Score score = scores.back() + frame.next->second;
            ++frame.next;

            auto budget = tick();
            if (!budget.ok()) {
                stack.clear();
                return budget;
            }

            if (cs.excludes(to) || cs.excludes(from, to)) {
                ++stats_.pruned;
                continue;
            }
            if (to == start) {
                if (accepts(score) && !visitor(path, score)) {
                    stack.clear();
                    return core::Result<void>();
                }
                continue;
            }
            if (to < start || position.count(to)) {
                continue;
            }
            // Closing the cycle needs at least one more edge.
            if (path.size() + 1 > depth_cap || (length_ceiling && path.size() + 1 > *length_ceiling) ||
                (score_ceiling && score + min_weight > *score_ceiling)) {
                ++stats_.pruned;
                continue;
            }

            position.emplace(to, path.size());
            path.push_back(to);
            scores.push_back(score);
            const auto& next_adjacency = graph_.successors(to);
            stack.push_back(Frame{to, next_adjacency.begin(), next_adjacency.end()});
        }
    }
    return core::Result<void>();
}

core::Result<CycleQueryResult> CycleEnumerator::girth() {
    CycleQueryResult result;
    std::vector<core::VertexId> witness;
    size_t best = kUnbounded;

    for (auto start : graph_.vertices()) {
        if (best == 1) {
            break;
        }
        // BFS from start; a predecessor p of start at distance d closes a
        // cycle of length d + 1.
        std::unordered_map<core::VertexId, size_t> dist;
        std::unordered_map<core::VertexId, core::VertexId> parent;
        std::deque<core::VertexId> queue;
        dist.emplace(start, 0);
        queue.push_back(start);
        while (!queue.empty()) {
            core::VertexId v = queue.front();
            queue.pop_front();
            size_t d = dist[v];
            if (d + 1 >= best) {
                break;
            }
            auto budget = tick();
            if (!budget.ok()) {
                return core::Result<CycleQueryResult>::propagate(budget);
            }
            for (const auto& entry : graph_.successors(v)) {
                if (dist.count(entry.first)) {
                    continue;
                }
                dist.emplace(entry.first, d + 1);
                parent.emplace(entry.first, v);
                queue.push_back(entry.first);
            }
        }

        for (const auto& entry : graph_.predecessors(start)) {
            auto it = dist.find(entry.first);
            if (it == dist.end() || it->second + 1 >= best) {
                continue;
            }
            best = it->second + 1;
            witness.clear();
            for (core::VertexId v = entry.first; v != start; v = parent[v]) {
                witness.push_back(v);
            }
            witness.push_back(start);
            std::reverse(witness.begin(), witness.end());
            witness.push_back(start);
        }
    }

    if (best == kUnbounded) {
        HGRAPH_DEBUG("Girth: graph is acyclic");
        return core::Result<CycleQueryResult>(std::move(result));
    }

    core::PathResult cycle;
    cycle.vertices = canonical_rotation(witness);
    cycle.length = best;
    for (size_t i = 1; i < cycle.vertices.size(); ++i) {
        cycle.score += *graph_.edge_weight(cycle.vertices[i - 1], cycle.vertices[i]);
    }
    result.girth = best;
    result.cycles.push_back(std::move(cycle));
    result.count = 1;
    return core::Result<CycleQueryResult>(std::move(result));
}

} // namespace search
} // namespace hgraph
