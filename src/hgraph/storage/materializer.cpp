#include "hgraph/storage/materializer.h"

#include "hgraph/common/logger.h"

namespace hgraph {
namespace storage {

Graph Materializer::build(const std::vector<core::Command>& commands) {
    Graph graph;
    for (const auto& cmd : commands) {
        apply(graph, cmd);
    }
    HGRAPH_DEBUG("Materialized {} command(s) into {} vertices and {} edges",
                 commands.size(), graph.vertex_count(), graph.edge_count());
    return graph;
}

void Materializer::apply(Graph& graph, const core::Command& command) {
    switch (command.type) {
        case core::CommandType::ADD_VERTEX:
            graph.add_vertex(command.a);
            break;
        case core::CommandType::ADD_EDGE:
            graph.add_edge(command.a, command.b, command.weight);
            break;
        case core::CommandType::REMOVE_VERTEX:
            graph.remove_vertex(command.a);
            break;
        case core::CommandType::REMOVE_EDGE:
            graph.remove_edge(command.a, command.b);
            break;
    }
}

std::vector<core::Command> Materializer::to_commands(const Graph& graph) {
    std::vector<core::Command> commands;
    commands.reserve(graph.vertex_count() + graph.edge_count());
    for (auto id : graph.vertices()) {
        commands.push_back(core::Command::AddVertex(id));
    }
    for (const auto& [from, to] : graph.edges()) {
        commands.push_back(core::Command::AddEdge(from, to, *graph.edge_weight(from, to)));
    }
    return commands;
}

} // namespace storage
} // namespace hgraph
