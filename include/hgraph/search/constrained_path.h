#ifndef HGRAPH_SEARCH_CONSTRAINED_PATH_H_
#define HGRAPH_SEARCH_CONSTRAINED_PATH_H_

#include <cstdint>
#include <optional>

#include "hgraph/constraint/constraint_set.h"
#include "hgraph/core/config.h"
#include "hgraph/core/result.h"
#include "hgraph/core/types.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace search {

/// Counters of the last search run, for logs and benchmarks.
struct SearchStats {
    uint64_t expansions = 0;
    uint64_t pushed = 0;
    uint64_t pruned = 0;
};

/**
 * @brief Constrained shortest path (CSP) between two vertices
 *
 * Best-first search over states (vertex, satisfied mandatory vertices,
 * ordered prefix reached, length, score, cycle-used flag), popped by lowest
 * score, then fewest vertices, then lexicographically lowest vertex
 * sequence. The first path popped for a state dominates every later one, so
 * ties between equal-score paths resolve to the lowest vertex ids.
 * Paths may revisit vertices unless `forbid_cycle` is set; revisits add
 * their edge weights again.
 *
 * The graph must outlive the search object.
 */
class ConstrainedPathSearch {
public:
    /// Mandatory vertices are tracked in a 64-bit set.
    static constexpr size_t kMaxMandatoryVertices = 64;

    explicit ConstrainedPathSearch(const storage::Graph& graph,
                                   core::SearchConfig config = core::SearchConfig::Default());

    /**
     * @brief Finds the minimum-score path from `start` to `end`
     * @return empty optional when no path satisfies the constraints;
     *         INVALID_CONSTRAINT, UNSUPPORTED or SEARCH_ABORTED on failure
     */
    core::Result<std::optional<core::PathResult>> find(core::VertexId start,
                                                       core::VertexId end,
                                                       const constraint::ConstraintSet& constraints);

    const SearchStats& stats() const { return stats_; }

private:
    const storage::Graph& graph_;
    core::SearchConfig config_;
    SearchStats stats_;
};

} // namespace search
} // namespace hgraph

#endif // HGRAPH_SEARCH_CONSTRAINED_PATH_H_
