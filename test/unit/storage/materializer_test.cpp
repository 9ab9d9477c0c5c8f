#include <gtest/gtest.h>

#include <map>
#include <random>
#include <set>

#include "hgraph/storage/materializer.h"

namespace hgraph {
namespace storage {

using core::Command;

TEST(MaterializerTest, EmptyLogBuildsEmptyGraph) {
    Graph graph = Materializer::build({});
    EXPECT_TRUE(graph.empty());
}

TEST(MaterializerTest, ReplaysInOrder) {
    Graph graph = Materializer::build({
        Command::AddVertex(1),
        Command::AddEdge(1, 2),
        Command::AddEdge(2, 3, 4),
        Command::RemoveEdge(1, 2),
        Command::AddEdge(2, 3, 6),
    });
    EXPECT_EQ(graph.vertices(), (std::vector<core::VertexId>{1, 2, 3}));
    EXPECT_FALSE(graph.has_edge(1, 2));
    EXPECT_EQ(graph.edge_weight(2, 3), 6u);
}

TEST(MaterializerTest, RemoveVertexCascades) {
    Graph graph = Materializer::build({
        Command::AddEdge(1, 2),
        Command::AddEdge(2, 3),
        Command::AddEdge(3, 1),
        Command::RemoveVertex(2),
    });
    EXPECT_FALSE(graph.has_vertex(2));
    EXPECT_EQ(graph.edges(), (std::vector<core::EdgeKey>{{3, 1}}));
}

TEST(MaterializerTest, ReAddedVertexForgetsItsEdges) {
    Graph graph = Materializer::build({
        Command::AddEdge(1, 2),
        Command::AddEdge(2, 1),
        Command::RemoveVertex(2),
        Command::AddVertex(2),
    });
    EXPECT_TRUE(graph.has_vertex(2));
    EXPECT_EQ(graph.edge_count(), 0u);
}

TEST(MaterializerTest, RemovingAbsentItemsIsNoOp) {
    Graph graph = Materializer::build({
        Command::AddVertex(1),
        Command::RemoveEdge(1, 2),
        Command::RemoveVertex(7),
    });
    EXPECT_EQ(graph.vertices(), (std::vector<core::VertexId>{1}));
}

TEST(MaterializerTest, OrderMatters) {
    Graph removed_last = Materializer::build({Command::AddEdge(1, 2), Command::RemoveEdge(1, 2)});
    Graph added_last = Materializer::build({Command::RemoveEdge(1, 2), Command::AddEdge(1, 2)});
    EXPECT_FALSE(removed_last.has_edge(1, 2));
    EXPECT_TRUE(added_last.has_edge(1, 2));
}

TEST(MaterializerTest, ToCommandsListsVerticesThenEdges) {
    Graph graph;
    graph.add_edge(3, 1, 2);
    graph.add_vertex(5);
    const std::vector<Command> expected = {
        Command::AddVertex(1), Command::AddVertex(3), Command::AddVertex(5), Command::AddEdge(3, 1, 2)};
    EXPECT_EQ(Materializer::to_commands(graph), expected);
}

namespace {

// Plain vertex set and weighted edge map, updated by the replay rules:
// edges bring their endpoints, a vertex takes its edges with it.
struct GraphModel {
    std::set<core::VertexId> vertices;
    std::map<core::EdgeKey, core::Weight> edges;

    void apply(const Command& cmd) {
        switch (cmd.type) {
            case core::CommandType::ADD_VERTEX:
                vertices.insert(cmd.a);
                break;
            case core::CommandType::ADD_EDGE:
                vertices.insert(cmd.a);
                vertices.insert(cmd.b);
                edges[{cmd.a, cmd.b}] = cmd.weight;
                break;
            case core::CommandType::REMOVE_VERTEX:
                vertices.erase(cmd.a);
                for (auto it = edges.begin(); it != edges.end();) {
                    if (it->first.first == cmd.a || it->first.second == cmd.a) {
                        it = edges.erase(it);
                    } else {
                        ++it;
                    }
                }
                break;
            case core::CommandType::REMOVE_EDGE:
                edges.erase({cmd.a, cmd.b});
                break;
        }
    }
};

std::map<core::EdgeKey, core::Weight> weighted_edges(const Graph& graph) {
    std::map<core::EdgeKey, core::Weight> edges;
    for (const auto& edge : graph.edges()) {
        edges[edge] = *graph.edge_weight(edge.first, edge.second);
    }
    return edges;
}

} // namespace

TEST(MaterializerTest, ReplayMatchesIndependentModel) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> op(0, 3);
    std::uniform_int_distribution<core::VertexId> id(1, 12);
    std::uniform_int_distribution<core::Weight> weight(1, 5);

    std::vector<Command> log;
    GraphModel model;
    for (int i = 0; i < 500; ++i) {
        switch (op(rng)) {
            case 0: log.push_back(Command::AddVertex(id(rng))); break;
            case 1: {
                core::VertexId from = id(rng);
                core::VertexId to = id(rng);
                log.push_back(Command::AddEdge(from, to, weight(rng)));
                break;
            }
            case 2: log.push_back(Command::RemoveVertex(id(rng))); break;
            default: {
                core::VertexId from = id(rng);
                core::VertexId to = id(rng);
                log.push_back(Command::RemoveEdge(from, to));
                break;
            }
        }
        model.apply(log.back());

        // Check the whole prefix every 50 commands, not just the end state.
        if ((i + 1) % 50 == 0) {
            Graph replayed = Materializer::build(log);
            EXPECT_EQ(replayed.vertices(),
                      std::vector<core::VertexId>(model.vertices.begin(), model.vertices.end()))
                << "after " << log.size() << " commands";
            EXPECT_EQ(weighted_edges(replayed), model.edges) << "after " << log.size() << " commands";
            EXPECT_EQ(replayed.edge_count(), model.edges.size());
        }
    }

    Graph replayed = Materializer::build(log);
    Graph compacted = Materializer::build(Materializer::to_commands(replayed));
    EXPECT_EQ(compacted.vertices(), replayed.vertices());
    EXPECT_EQ(weighted_edges(compacted), model.edges);
}

} // namespace storage
} // namespace hgraph
