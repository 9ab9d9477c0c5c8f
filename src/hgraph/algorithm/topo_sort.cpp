#include "hgraph/algorithm/topo_sort.h"

#include <functional>
#include <queue>
#include <unordered_map>

namespace hgraph {
namespace algorithm {

std::optional<std::vector<core::VertexId>> topological_sort(const storage::Graph& graph) {
    std::unordered_map<core::VertexId, size_t> pending_in;
    std::priority_queue<core::VertexId, std::vector<core::VertexId>, std::greater<core::VertexId>> ready;

    for (auto v : graph.vertices()) {
        size_t in = graph.in_degree(v);
        pending_in.emplace(v, in);
        if (in == 0) {
            ready.push(v);
        }
    }

    std::vector<core::VertexId> order;
    order.reserve(graph.vertex_count());
    while (!ready.empty()) {
        core::VertexId v = ready.top();
        ready.pop();
        order.push_back(v);
        for (const auto& entry : graph.successors(v)) {
            if (--pending_in[entry.first] == 0) {
                ready.push(entry.first);
            }
        }
    }

    if (order.size() != graph.vertex_count()) {
        return std::nullopt;
    }
    return order;
}

bool is_dag(const storage::Graph& graph) {
    return topological_sort(graph).has_value();
}

} // namespace algorithm
} // namespace hgraph
