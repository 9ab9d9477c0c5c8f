#ifndef HGRAPH_ALGORITHM_GRAPH_SUMMARY_H_
#define HGRAPH_ALGORITHM_GRAPH_SUMMARY_H_

#include <optional>
#include <string>

#include "hgraph/core/types.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace algorithm {

/**
 * @brief Descriptive statistics of a graph snapshot
 */
struct GraphSummary {
    size_t vertex_count = 0;
    size_t edge_count = 0;
    size_t self_loops = 0;
    std::optional<core::VertexId> min_vertex;
    std::optional<core::VertexId> max_vertex;
    std::optional<core::Weight> min_weight;
    std::optional<core::Weight> max_weight;
    size_t max_out_degree = 0;
    size_t max_in_degree = 0;
    bool acyclic = true;
};

GraphSummary summarize(const storage::Graph& graph);

/// Multi-line "Key: value" rendering; absent values print as "-".
std::string format_summary(const GraphSummary& summary);

} // namespace algorithm
} // namespace hgraph

#endif // HGRAPH_ALGORITHM_GRAPH_SUMMARY_H_
