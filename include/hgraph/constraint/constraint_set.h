#ifndef HGRAPH_CONSTRAINT_CONSTRAINT_SET_H_
#define HGRAPH_CONSTRAINT_CONSTRAINT_SET_H_

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hgraph/core/result.h"
#include "hgraph/core/types.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace constraint {

/**
 * @brief Conjunction of predicates over a path or cycle
 *
 * Every populated field must hold. Lengths count vertices, scores sum the
 * weights of traversed edges. `include_edges` applies to cycle queries only;
 * `ordered_vertices`, `require_cycle` and `forbid_cycle` apply to path
 * queries only.
 */
struct ConstraintSet {
    std::set<core::VertexId> include_vertices;
    std::set<core::VertexId> exclude_vertices;
    std::set<core::EdgeKey> include_edges;
    std::set<core::EdgeKey> exclude_edges;

    /// Mandatory vertices whose first visits follow this relative order.
    std::vector<core::VertexId> ordered_vertices;

    std::optional<size_t> exact_length;
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;

    std::optional<core::Score> exact_score;
    std::optional<core::Score> min_score;
    std::optional<core::Score> max_score;

    bool require_cycle = false;
    bool forbid_cycle = false;

    bool empty() const;

    /// Tightest lower length bound from exact_length and min_length.
    std::optional<size_t> length_floor() const;
    /// Tightest upper length bound from exact_length and max_length.
    std::optional<size_t> length_ceiling() const;
    std::optional<core::Score> score_floor() const;
    std::optional<core::Score> score_ceiling() const;

    bool excludes(core::VertexId id) const { return exclude_vertices.count(id) > 0; }
    bool excludes(core::VertexId from, core::VertexId to) const {
        return exclude_edges.count({from, to}) > 0;
    }

    /// One-line summary for logs.
    std::string describe() const;
};

/**
 * @brief Rejects contradictory constraints for a start -> end path query
 * @return INVALID_CONSTRAINT describing the first contradiction found
 */
core::Result<void> validate_path_constraints(const ConstraintSet& constraints,
                                             const storage::Graph& graph,
                                             core::VertexId start,
                                             core::VertexId end);

/**
 * @brief Rejects contradictory constraints for a cycle query
 * @return INVALID_CONSTRAINT describing the first contradiction found
 */
core::Result<void> validate_cycle_constraints(const ConstraintSet& constraints,
                                              const storage::Graph& graph);

} // namespace constraint
} // namespace hgraph

#endif // HGRAPH_CONSTRAINT_CONSTRAINT_SET_H_
