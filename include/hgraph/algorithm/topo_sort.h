#ifndef HGRAPH_ALGORITHM_TOPO_SORT_H_
#define HGRAPH_ALGORITHM_TOPO_SORT_H_

#include <optional>
#include <vector>

#include "hgraph/core/types.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace algorithm {

/**
 * @brief Topological order by Kahn's algorithm
 *
 * Among ready vertices the smallest id is emitted first, so the order is
 * deterministic. Returns nullopt when the graph contains a cycle
 * (self-loops included).
 */
std::optional<std::vector<core::VertexId>> topological_sort(const storage::Graph& graph);

bool is_dag(const storage::Graph& graph);

} // namespace algorithm
} // namespace hgraph

#endif // HGRAPH_ALGORITHM_TOPO_SORT_H_
