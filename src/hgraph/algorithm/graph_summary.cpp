#include "hgraph/algorithm/graph_summary.h"

#include <algorithm>
#include <sstream>

#include "hgraph/algorithm/topo_sort.h"

namespace hgraph {
namespace algorithm {

namespace {

template<typename T>
std::string or_dash(const std::optional<T>& value) {
    return value ? std::to_string(*value) : std::string("-");
}

} // namespace

GraphSummary summarize(const storage::Graph& graph) {
    GraphSummary summary;
    summary.vertex_count = graph.vertex_count();
    summary.edge_count = graph.edge_count();
    summary.min_vertex = graph.min_vertex();
    summary.max_vertex = graph.max_vertex();
    summary.min_weight = graph.min_edge_weight();
    summary.max_weight = graph.max_edge_weight();
    for (auto v : graph.vertices()) {
        summary.max_out_degree = std::max(summary.max_out_degree, graph.out_degree(v));
        summary.max_in_degree = std::max(summary.max_in_degree, graph.in_degree(v));
        if (graph.has_edge(v, v)) {
            ++summary.self_loops;
        }
    }
    summary.acyclic = is_dag(graph);
    return summary;
}

std::string format_summary(const GraphSummary& summary) {
    std::ostringstream oss;
    oss << "Vertices: " << summary.vertex_count << "\n"
        << "Edges: " << summary.edge_count << "\n"
        << "Self-loops: " << summary.self_loops << "\n"
        << "Min vertex id: " << or_dash(summary.min_vertex) << "\n"
        << "Max vertex id: " << or_dash(summary.max_vertex) << "\n"
        << "Min edge weight: " << or_dash(summary.min_weight) << "\n"
        << "Max edge weight: " << or_dash(summary.max_weight) << "\n"
        << "Max out-degree: " << summary.max_out_degree << "\n"
        << "Max in-degree: " << summary.max_in_degree << "\n"
        << "DAG: " << (summary.acyclic ? "yes" : "no") << "\n";
    return oss.str();
}

} // namespace algorithm
} // namespace hgraph
