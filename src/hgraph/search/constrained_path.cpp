#include "hgraph/search/constrained_path.h"

#include <algorithm>
#include <bitset>
#include <deque>
#include <limits>
#include <queue>
#include <set>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "hgraph/common/logger.h"
#include "hgraph/constraint/checker.h"

namespace hgraph {
namespace search {

namespace {

constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

struct Node {
    core::VertexId vertex;
    size_t parent;
    core::Score score;
    size_t length;
    uint64_t mask;      // satisfied mandatory vertices
    size_t ordered;     // number of ordered vertices reached so far
    bool cycle;         // some vertex was revisited
};

struct QueueEntry {
    core::Score score;
    size_t length;
    size_t index;
};

/**
 * Frontier order: lowest score, then fewest vertices, then the
 * lexicographically lowest vertex sequence. Entries compared on the
 * sequence have equal length, so both walks reach the shared prefix
 * (at the latest the start node) in the same number of steps.
 */
class FrontierOrder {
public:
    explicit FrontierOrder(const std::vector<Node>* arena) : arena_(arena) {}

    /// True when `a` pops after `b`.
    bool operator()(const QueueEntry& a, const QueueEntry& b) const {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.length != b.length) {
            return a.length > b.length;
        }
        return sequence_less(b.index, a.index);
    }

private:
    bool sequence_less(size_t left, size_t right) const {
        const std::vector<Node>& arena = *arena_;
        size_t lhs = left;
        size_t rhs = right;
        // The position closest to the start where the vertices differ decides.
        int order = 0;
        while (lhs != rhs && lhs != kNoParent && rhs != kNoParent) {
            if (arena[lhs].vertex != arena[rhs].vertex) {
                order = arena[lhs].vertex < arena[rhs].vertex ? -1 : 1;
            }
            lhs = arena[lhs].parent;
            rhs = arena[rhs].parent;
        }
        if (order != 0) {
            return order < 0;
        }
        return left < right;
    }

    const std::vector<Node>* arena_;
};

struct StateKey {
    core::VertexId vertex;
    uint64_t mask;
    size_t ordered;
    bool cycle;
    size_t length;
    core::Score score;
    std::vector<core::VertexId> visited;

    bool operator<(const StateKey& other) const {
        return std::tie(vertex, mask, ordered, cycle, length, score, visited) <
               std::tie(other.vertex, other.mask, other.ordered, other.cycle, other.length,
                        other.score, other.visited);
    }
};

/**
 * Per-query constants derived from the graph and the constraint set.
 */
class PathQuery {
public:
    PathQuery(const storage::Graph& graph, const constraint::ConstraintSet& cs, core::VertexId end)
        : graph_(graph), cs_(cs), end_(end) {
        std::set<core::VertexId> mandatory(cs.include_vertices.begin(), cs.include_vertices.end());
        mandatory.insert(cs.ordered_vertices.begin(), cs.ordered_vertices.end());
        for (auto id : mandatory) {
            size_t bit = mandatory_bit_.size();
            mandatory_bit_.emplace(id, bit);
        }
        full_mask_ = mandatory.size() >= 64 ? ~uint64_t(0) : ((uint64_t(1) << mandatory.size()) - 1);
        for (size_t i = 0; i < cs.ordered_vertices.size(); ++i) {
            ordered_pos_.emplace(cs.ordered_vertices[i], i);
        }
        min_weight_ = graph.min_edge_weight().value_or(0);
        length_floor_ = cs.length_floor();
        length_ceiling_ = cs.length_ceiling();
        score_floor_ = cs.score_floor();
        score_ceiling_ = cs.score_ceiling();
        compute_distances_to_end();
    }

    size_t mandatory_count() const { return mandatory_bit_.size(); }

    /// Applies the effects of entering `vertex`; false when that breaks the order.
    bool enter(Node& node, const std::vector<Node>& arena) const {
        auto bit = mandatory_bit_.find(node.vertex);
        if (bit != mandatory_bit_.end()) {
            node.mask |= uint64_t(1) << bit->second;
        }

        auto pos = ordered_pos_.find(node.vertex);
        if (pos != ordered_pos_.end()) {
            size_t j = pos->second;
            if (j == node.ordered) {
                ++node.ordered;
            } else if (j + 1 != node.ordered) {
                return false;
            }
        }

        if ((cs_.require_cycle || cs_.forbid_cycle) && on_path(arena, node.parent, node.vertex)) {
            if (cs_.forbid_cycle) {
                return false;
            }
            node.cycle = true;
        }
        return true;
    }

    /// True when no completion of `node` can meet the length and score ceilings.
    bool prune(const Node& node) const {
        auto dist = distance_to_end_.find(node.vertex);
        if (dist == distance_to_end_.end()) {
            return true;
        }
        size_t hops = dist->second;
        hops = std::max(hops, std::bitset<64>(full_mask_ & ~node.mask).count());
        if (length_floor_ && *length_floor_ > node.length) {
            hops = std::max(hops, *length_floor_ - node.length);
        }
        if (length_ceiling_ && node.length + hops > *length_ceiling_) {
            return true;
        }
        if (score_ceiling_ &&
            node.score + static_cast<core::Score>(hops) * min_weight_ > *score_ceiling_) {
            return true;
        }
        return false;
    }

    bool is_goal(const Node& node) const {
        return node.vertex == end_ && node.mask == full_mask_ &&
               node.ordered == cs_.ordered_vertices.size() &&
               (!length_floor_ || node.length >= *length_floor_) &&
               (!score_floor_ || node.score >= *score_floor_) &&
               (!cs_.require_cycle || node.cycle);
    }

    StateKey key(const Node& node, const std::vector<Node>& arena) const {
        StateKey key{node.vertex, node.mask, node.ordered, node.cycle, 0, 0, {}};
        if (length_ceiling_) {
            key.length = node.length;
        } else if (length_floor_) {
            key.length = std::min(node.length, *length_floor_);
        }
        if (score_floor_) {
            key.score = std::min(node.score, *score_floor_);
        }
        if (cs_.forbid_cycle || (cs_.require_cycle && !node.cycle)) {
            for (size_t i = node.parent; i != kNoParent; i = arena[i].parent) {
                key.visited.push_back(arena[i].vertex);
            }
            std::sort(key.visited.begin(), key.visited.end());
        }
        return key;
    }

private:
    static bool on_path(const std::vector<Node>& arena, size_t index, core::VertexId vertex) {
        for (size_t i = index; i != kNoParent; i = arena[i].parent) {
            if (arena[i].vertex == vertex) {
                return true;
            }
        }
        return false;
    }

    // Hop distance to the end vertex, avoiding excluded vertices and edges.
    void compute_distances_to_end() {
        std::deque<core::VertexId> queue;
        distance_to_end_.emplace(end_, 0);
        queue.push_back(end_);
        while (!queue.empty()) {
            core::VertexId v = queue.front();
            queue.pop_front();
            size_t d = distance_to_end_[v];
            for (const auto& [pred, weight] : graph_.predecessors(v)) {
                (void)weight;
                if (cs_.excludes(pred) || cs_.excludes(pred, v) || distance_to_end_.count(pred)) {
                    continue;
                }
                distance_to_end_.emplace(pred, d + 1);
                queue.push_back(pred);
            }
        }
    }

    const storage::Graph& graph_;
    const constraint::ConstraintSet& cs_;
    core::VertexId end_;
    std::unordered_map<core::VertexId, size_t> mandatory_bit_;
    std::unordered_map<core::VertexId, size_t> ordered_pos_;
    std::unordered_map<core::VertexId, size_t> distance_to_end_;
    uint64_t full_mask_;
    core::Score min_weight_;
    std::optional<size_t> length_floor_;
    std::optional<size_t> length_ceiling_;
    std::optional<core::Score> score_floor_;
    std::optional<core::Score> score_ceiling_;
};

core::PathResult reconstruct(const std::vector<Node>& arena, size_t index) {
    core::PathResult result;
    result.score = arena[index].score;
    result.length = arena[index].length;
    for (size_t i = index; i != kNoParent; i = arena[i].parent) {
        result.vertices.push_back(arena[i].vertex);
    }
    std::reverse(result.vertices.begin(), result.vertices.end());
    return result;
}

} // namespace

ConstrainedPathSearch::ConstrainedPathSearch(const storage::Graph& graph, core::SearchConfig config)
    : graph_(graph), config_(config) {}

core::Result<std::optional<core::PathResult>> ConstrainedPathSearch::find(
        core::VertexId start,
        core::VertexId end,
        const constraint::ConstraintSet& constraints) {
    using PathOutcome = core::Result<std::optional<core::PathResult>>;
    stats_ = SearchStats();

    auto valid = constraint::validate_path_constraints(constraints, graph_, start, end);
    if (!valid.ok()) {
        return PathOutcome::propagate(valid);
    }

    PathQuery query(graph_, constraints, end);
    if (query.mandatory_count() > kMaxMandatoryVertices) {
        return PathOutcome::error(core::Error::Code::UNSUPPORTED,
                                  "At most " + std::to_string(kMaxMandatoryVertices) +
                                  " mandatory vertices are supported, got " +
                                  std::to_string(query.mandatory_count()));
    }
    HGRAPH_DEBUG("CSP {} -> {} with {}", start, end, constraints.describe());

    std::vector<Node> arena;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, FrontierOrder> frontier{FrontierOrder(&arena)};
    std::set<StateKey> closed;

    auto push = [&](Node node) {
        if (!query.enter(node, arena) || query.prune(node)) {
            ++stats_.pruned;
            return;
        }
        arena.push_back(node);
        frontier.push(QueueEntry{node.score, node.length, arena.size() - 1});
        ++stats_.pushed;
    };

    push(Node{start, kNoParent, 0, 1, 0, 0, false});

    while (!frontier.empty()) {
        QueueEntry entry = frontier.top();
        frontier.pop();
        const size_t index = entry.index;

        if (!closed.insert(query.key(arena[index], arena)).second) {
            continue;
        }

        if (query.is_goal(arena[index])) {
            core::PathResult path = reconstruct(arena, index);
            HGRAPH_DEBUG("CSP found {} (score {}) after {} expansions",
                         core::to_string(path.vertices), path.score, stats_.expansions);
            auto checked = constraint::check_path(graph_, path, constraints, start, end);
            if (!checked.ok()) {
                return PathOutcome::propagate(checked);
            }
            return PathOutcome(std::optional<core::PathResult>(std::move(path)));
        }

        if (config_.cancel && config_.cancel->load()) {
            return PathOutcome::error(core::Error::Code::SEARCH_ABORTED, "Search cancelled");
        }
        if (config_.max_expansions > 0 && stats_.expansions >= config_.max_expansions) {
            return PathOutcome::error(core::Error::Code::SEARCH_ABORTED,
                                      "Search exceeded " + std::to_string(config_.max_expansions) +
                                      " expansions");
        }
        ++stats_.expansions;

        // Copy: push() may reallocate the arena.
        const Node current = arena[index];
        for (const auto& [next, weight] : graph_.successors(current.vertex)) {
            if (constraints.excludes(next) || constraints.excludes(current.vertex, next)) {
                ++stats_.pruned;
                continue;
            }
            push(Node{next, index, current.score + weight, current.length + 1,
                      current.mask, current.ordered, current.cycle});
        }
    }

    HGRAPH_DEBUG("CSP {} -> {} exhausted after {} expansions ({} pruned)",
                 start, end, stats_.expansions, stats_.pruned);
    return PathOutcome(std::optional<core::PathResult>());
}

} // namespace search
} // namespace hgraph
