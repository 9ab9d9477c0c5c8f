#ifndef HGRAPH_CONSTRAINT_CHECKER_H_
#define HGRAPH_CONSTRAINT_CHECKER_H_

#include "hgraph/constraint/constraint_set.h"
#include "hgraph/core/result.h"
#include "hgraph/core/types.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace constraint {

/**
 * @brief Independent re-check of a path returned by a search
 *
 * Verifies that the path runs from `start` to `end` over existing edges,
 * that the reported length and score match, and that every constraint
 * holds. Fails with INTERNAL naming the first violated predicate.
 */
core::Result<void> check_path(const storage::Graph& graph,
                              const core::PathResult& path,
                              const ConstraintSet& constraints,
                              core::VertexId start,
                              core::VertexId end);

/**
 * @brief Independent re-check of a cycle returned by a search
 *
 * The cycle must be a closed walk without repeated internal vertices.
 */
core::Result<void> check_cycle(const storage::Graph& graph,
                               const core::PathResult& cycle,
                               const ConstraintSet& constraints);

/// True when the first visits of `ordered` occur in the given relative order
/// and no earlier ordered vertex is re-entered after a later one.
bool respects_order(const std::vector<core::VertexId>& walk,
                    const std::vector<core::VertexId>& ordered);

} // namespace constraint
} // namespace hgraph

#endif // HGRAPH_CONSTRAINT_CHECKER_H_
