#include "hgraph/search/cycle_enumerator.h"

#include <deque>
#include <unordered_map>

#include "hgraph/common/logger.h"
#include "hgraph/constraint/checker.h"

namespace hgraph {
namespace search {

namespace {

/**
 * Backtracking state for a Hamiltonian cycle search rooted at the smallest
 * vertex. Vertices are addressed by their rank in ascending id order.
 */
class HamiltonianSearch {
public:
    HamiltonianSearch(const storage::Graph& graph, const constraint::ConstraintSet& cs)
        : graph_(graph), cs_(cs), vertices_(graph.vertices()), visited_(vertices_.size(), false) {
        for (size_t i = 0; i < vertices_.size(); ++i) {
            rank_.emplace(vertices_[i], i);
        }
    }

    bool usable(core::VertexId from, core::VertexId to) const {
        return !cs_.excludes(from, to);
    }

    /// Every vertex needs one usable outgoing and one usable incoming edge.
    bool degrees_allow_cycle() const {
        for (auto v : vertices_) {
            bool out = false;
            for (const auto& entry : graph_.successors(v)) {
                if (usable(v, entry.first)) {
                    out = true;
                    break;
                }
            }
            bool in = false;
            for (const auto& entry : graph_.predecessors(v)) {
                if (usable(entry.first, v)) {
                    in = true;
                    break;
                }
            }
            if (!out || !in) {
                return false;
            }
        }
        return true;
    }

    void mark(core::VertexId v, bool value) {
        visited_[rank_.at(v)] = value;
    }

    bool is_visited(core::VertexId v) const {
        return visited_[rank_.at(v)];
    }

    /**
     * True when every unvisited vertex is reachable from `current` through
     * unvisited vertices and the root can still be re-entered.
     */
    bool can_complete(core::VertexId current, size_t unvisited) const {
        core::VertexId root = vertices_.front();
        if (unvisited == 0) {
            return graph_.has_edge(current, root) && usable(current, root);
        }

        std::vector<bool> seen(vertices_.size(), false);
        std::deque<core::VertexId> queue;
        queue.push_back(current);
        size_t reached = 0;
        bool closes = false;
        while (!queue.empty()) {
            core::VertexId v = queue.front();
            queue.pop_front();
            for (const auto& entry : graph_.successors(v)) {
                core::VertexId next = entry.first;
                if (!usable(v, next)) {
                    continue;
                }
                if (next == root && v != current) {
                    closes = true;
                }
                size_t r = rank_.at(next);
                if (visited_[r] || seen[r]) {
                    continue;
                }
                seen[r] = true;
                ++reached;
                queue.push_back(next);
            }
        }
        return reached == unvisited && closes;
    }

    const std::vector<core::VertexId>& vertices() const { return vertices_; }

private:
    const storage::Graph& graph_;
    const constraint::ConstraintSet& cs_;
    std::vector<core::VertexId> vertices_;
    std::vector<bool> visited_;
    std::unordered_map<core::VertexId, size_t> rank_;
};

struct Frame {
    core::VertexId vertex;
    storage::Graph::Adjacency::const_iterator next;
    storage::Graph::Adjacency::const_iterator end;
};

} // namespace

core::Result<CycleQueryResult> CycleEnumerator::hamiltonian(const constraint::ConstraintSet& cs) {
    CycleQueryResult result;
    const size_t n = graph_.vertex_count();
    const auto length_floor = cs.length_floor();
    const auto length_ceiling = cs.length_ceiling();
    const auto score_ceiling = cs.score_ceiling();
    const core::Score min_weight = graph_.min_edge_weight().value_or(0);

    // A spanning cycle cannot avoid a vertex of the graph.
    bool impossible = n == 0 || (length_floor && *length_floor > n) ||
                      (length_ceiling && *length_ceiling < n);
    for (auto id : cs.exclude_vertices) {
        impossible = impossible || graph_.has_vertex(id);
    }
    if (impossible) {
        HGRAPH_DEBUG("Hamiltonian: ruled out before search");
        return core::Result<CycleQueryResult>(std::move(result));
    }

    HamiltonianSearch search(graph_, cs);
    if (!search.degrees_allow_cycle()) {
        HGRAPH_DEBUG("Hamiltonian: some vertex has no usable in or out edge");
        return core::Result<CycleQueryResult>(std::move(result));
    }

    const core::VertexId root = search.vertices().front();
    std::vector<core::VertexId> path{root};
    std::vector<core::Score> scores{0};
    std::vector<Frame> stack;
    search.mark(root, true);
    const auto& root_adjacency = graph_.successors(root);
    stack.push_back(Frame{root, root_adjacency.begin(), root_adjacency.end()});

    while (!stack.empty()) {
        Frame& frame = stack.back();
        if (frame.next == frame.end) {
            search.mark(frame.vertex, false);
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
            return core::Result<CycleQueryResult>::propagate(budget);
        }
        if (!search.usable(from, to)) {
            continue;
        }

        if (path.size() == n) {
            if (to != root) {
                continue;
            }
            core::PathResult candidate(path, n, score);
            candidate.vertices.push_back(root);
            if (constraint::check_cycle(graph_, candidate, cs).ok()) {
                HGRAPH_DEBUG("Hamiltonian: found {} after {} expansions",
                             core::to_string(candidate.vertices), stats_.expansions);
                result.cycles.push_back(std::move(candidate));
                result.count = 1;
                return core::Result<CycleQueryResult>(std::move(result));
            }
            continue;
        }

        if (to == root || search.is_visited(to)) {
            continue;
        }
        // n - path.size() edges remain once `to` is appended.
        if (score_ceiling &&
            score + min_weight * static_cast<core::Score>(n - path.size()) > *score_ceiling) {
            ++stats_.pruned;
            continue;
        }

        search.mark(to, true);
        if (!search.can_complete(to, n - path.size() - 1)) {
            search.mark(to, false);
            ++stats_.pruned;
            continue;
        }
        path.push_back(to);
        scores.push_back(score);
        const auto& adjacency = graph_.successors(to);
        stack.push_back(Frame{to, adjacency.begin(), adjacency.end()});
    }

    HGRAPH_DEBUG("Hamiltonian: none found after {} expansions", stats_.expansions);
    return core::Result<CycleQueryResult>(std::move(result));
}

} // namespace search
} // namespace hgraph
