#ifndef HGRAPH_SEARCH_CYCLE_ENUMERATOR_H_
#define HGRAPH_SEARCH_CYCLE_ENUMERATOR_H_

#include <functional>
#include <optional>
#include <vector>

#include "hgraph/constraint/constraint_set.h"
#include "hgraph/core/config.h"
#include "hgraph/core/result.h"
#include "hgraph/core/types.h"
#include "hgraph/search/constrained_path.h"
#include "hgraph/search/cycle_request.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace search {

/**
 * @brief Outcome of a cycle query
 *
 * `cycles` holds closed walks in canonical rotation (starting at their
 * minimum vertex). `count` is the number of satisfying cycles for
 * CountCycles and `cycles.size()` otherwise. `girth` is set by Girth only.
 */
struct CycleQueryResult {
    std::vector<core::PathResult> cycles;
    size_t count = 0;
    std::optional<size_t> girth;

    bool found() const { return count > 0 || girth.has_value(); }
};

/**
 * @brief Enumerates simple cycles of a graph snapshot under constraints
 *
 * Discovery order is deterministic: start vertices ascending, outgoing
 * edges by ascending target id. Every cycle is reported once, rooted at
 * its minimum vertex. All searches use explicit stacks.
 *
 * The graph must outlive the enumerator.
 */
class CycleEnumerator {
public:
    explicit CycleEnumerator(const storage::Graph& graph,
                             core::SearchConfig config = core::SearchConfig::Default());

    /**
     * @brief Runs one cycle query
     * @return INVALID_CONSTRAINT for a contradictory request, SEARCH_ABORTED
     *         when the expansion budget or cancel flag stops the search
     */
    core::Result<CycleQueryResult> run(const CycleRequest& request,
                                       const constraint::ConstraintSet& constraints);

    core::Result<void> validate(const CycleRequest& request,
                                const constraint::ConstraintSet& constraints) const;

    const SearchStats& stats() const { return stats_; }

    /// Rotates a closed walk so that it starts (and ends) at its minimum vertex.
    static std::vector<core::VertexId> canonical_rotation(const std::vector<core::VertexId>& cycle);

private:
    /// Return false from the visitor to stop the enumeration. `depth_cap` is
    /// re-read at every extension so a visitor may tighten it.
    using Visitor = std::function<bool(const std::vector<core::VertexId>& path, core::Score score)>;

    core::Result<void> enumerate(const constraint::ConstraintSet& constraints,
                                 const size_t& depth_cap,
                                 const Visitor& visitor);
    core::Result<CycleQueryResult> girth();
    core::Result<CycleQueryResult> hamiltonian(const constraint::ConstraintSet& constraints);
    core::Result<void> tick();

    const storage::Graph& graph_;
    core::SearchConfig config_;
    SearchStats stats_;
};

} // namespace search
} // namespace hgraph

#endif // HGRAPH_SEARCH_CYCLE_ENUMERATOR_H_
