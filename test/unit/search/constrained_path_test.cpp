#include <gtest/gtest.h>

#include <atomic>

#include "hgraph/search/constrained_path.h"

namespace hgraph {
namespace search {

using constraint::ConstraintSet;

class ConstrainedPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 1 -> 2 -> 3 -> 4 -> 1 with the shortcut 2 -> 4.
        graph_.add_edge(1, 2);
        graph_.add_edge(2, 3);
        graph_.add_edge(3, 4);
        graph_.add_edge(4, 1);
        graph_.add_edge(2, 4);
    }

    std::optional<core::PathResult> find(core::VertexId start, core::VertexId end, const ConstraintSet& cs) {
        ConstrainedPathSearch search(graph_);
        auto result = search.find(start, end, cs);
        EXPECT_TRUE(result.ok()) << result.error();
        if (!result.ok()) {
            return std::nullopt;
        }
        return result.value();
    }

    storage::Graph graph_;
};

TEST_F(ConstrainedPathTest, UnconstrainedShortestPath) {
    auto path = find(1, 4, ConstraintSet());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 4}));
    EXPECT_EQ(path->score, 2);
    EXPECT_EQ(path->length, 3u);
}

TEST_F(ConstrainedPathTest, ExcludedVertexBlocksEveryRoute) {
    ConstraintSet cs;
    cs.exclude_vertices = {2};
    EXPECT_FALSE(find(1, 4, cs).has_value());
}

TEST_F(ConstrainedPathTest, ExcludedEdgeForcesDetour) {
    ConstraintSet cs;
    cs.exclude_edges = {{2, 4}};
    auto path = find(1, 4, cs);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 3, 4}));
}

TEST_F(ConstrainedPathTest, IncludedVertexIsVisited) {
    ConstraintSet cs;
    cs.include_vertices = {3};
    auto path = find(1, 4, cs);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 3, 4}));
    EXPECT_EQ(path->score, 3);
}

TEST_F(ConstrainedPathTest, OrderedVertices) {
    ConstraintSet in_order;
    in_order.ordered_vertices = {2, 3};
    auto path = find(1, 4, in_order);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 3, 4}));

    // Reaching 3 requires passing 2 first.
    ConstraintSet reversed;
    reversed.ordered_vertices = {3, 2};
    EXPECT_FALSE(find(1, 4, reversed).has_value());
}

TEST_F(ConstrainedPathTest, OrderedVerticesMayInterleave) {
    ConstraintSet cs;
    cs.ordered_vertices = {4, 3};
    auto path = find(1, 3, cs);
    ASSERT_TRUE(path.has_value());
    // 2 is not ordered, so it may appear anywhere.
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 4, 1, 2, 3}));
}

TEST_F(ConstrainedPathTest, RequireCycleRevisitsAVertex) {
    ConstraintSet cs;
    cs.require_cycle = true;
    auto path = find(1, 4, cs);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 4, 1, 2, 4}));
    EXPECT_EQ(path->score, 5);
}

TEST_F(ConstrainedPathTest, ForbidCycleKeepsPathSimple) {
    ConstraintSet cs;
    cs.forbid_cycle = true;
    cs.min_length = 4;
    auto path = find(1, 4, cs);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 3, 4}));

    cs.min_length = 5;
    EXPECT_FALSE(find(1, 4, cs).has_value());
}

TEST_F(ConstrainedPathTest, LengthBounds) {
    ConstraintSet exact;
    exact.exact_length = 4;
    auto path = find(1, 4, exact);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->length, 4u);

    ConstraintSet longer;
    longer.min_length = 5;
    path = find(1, 4, longer);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 4, 1, 2, 4}));
}

TEST_F(ConstrainedPathTest, ScoreBounds) {
    ConstraintSet ceiling;
    ceiling.max_score = 1;
    EXPECT_FALSE(find(1, 4, ceiling).has_value());

    ConstraintSet floor;
    floor.min_score = 3;
    auto path = find(1, 4, floor);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 3, 4}));
    EXPECT_EQ(path->score, 3);
}

TEST_F(ConstrainedPathTest, WeightsDriveTheChoice) {
    graph_.add_edge(2, 4, 5);
    auto path = find(1, 4, ConstraintSet());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{1, 2, 3, 4}));
    EXPECT_EQ(path->score, 3);
}

TEST_F(ConstrainedPathTest, StartEqualsEnd) {
    auto path = find(2, 2, ConstraintSet());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{2}));
    EXPECT_EQ(path->score, 0);

    ConstraintSet cs;
    cs.require_cycle = true;
    path = find(2, 2, cs);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->vertices, (std::vector<core::VertexId>{2, 4, 1, 2}));
}

TEST(ConstrainedPathTieTest, EqualScoresPreferLowerVertexSequence) {
    storage::Graph graph;
    graph.add_edge(1, 3);
    graph.add_edge(1, 2);
    graph.add_edge(3, 4);
    graph.add_edge(2, 4);
    ConstrainedPathSearch search(graph);
    auto path = search.find(1, 4, ConstraintSet());
    ASSERT_TRUE(path.ok());
    ASSERT_TRUE(path.value().has_value());
    EXPECT_EQ(path.value()->vertices, (std::vector<core::VertexId>{1, 2, 4}));
}

TEST(ConstrainedPathTieTest, TieDecidedByEarliestDifferingVertex) {
    // 1 -> 2 -> 7 -> 9 and 1 -> 3 -> 6 -> 9: the second route reaches its
    // last inner vertex with a lower id, the first wins at position 1.
    storage::Graph graph;
    graph.add_edge(1, 2);
    graph.add_edge(1, 3);
    graph.add_edge(2, 7);
    graph.add_edge(3, 6);
    graph.add_edge(7, 9);
    graph.add_edge(6, 9);
    ConstrainedPathSearch search(graph);
    auto path = search.find(1, 9, ConstraintSet());
    ASSERT_TRUE(path.ok());
    ASSERT_TRUE(path.value().has_value());
    EXPECT_EQ(path.value()->vertices, (std::vector<core::VertexId>{1, 2, 7, 9}));
}

TEST(ConstrainedPathTieTest, MergedStateKeepsLowerSequence) {
    // Both routes reach 5 with the same score and mandatory set.
    storage::Graph graph;
    graph.add_edge(1, 3);
    graph.add_edge(1, 2);
    graph.add_edge(3, 4);
    graph.add_edge(2, 6);
    graph.add_edge(4, 5);
    graph.add_edge(6, 5);
    graph.add_edge(5, 9);
    ConstraintSet cs;
    cs.include_vertices = {5};
    ConstrainedPathSearch search(graph);
    auto path = search.find(1, 9, cs);
    ASSERT_TRUE(path.ok()) << path.error();
    ASSERT_TRUE(path.value().has_value());
    EXPECT_EQ(path.value()->vertices, (std::vector<core::VertexId>{1, 2, 6, 5, 9}));
    EXPECT_EQ(path.value()->score, 4);
}

TEST_F(ConstrainedPathTest, InvalidConstraintsAreReported) {
    ConstraintSet cs;
    cs.exclude_vertices = {4};
    ConstrainedPathSearch search(graph_);
    auto result = search.find(1, 4, cs);
    EXPECT_EQ(result.code(), core::Error::Code::INVALID_CONSTRAINT);
}

TEST(ConstrainedPathLimitsTest, TooManyMandatoryVerticesIsUnsupported) {
    storage::Graph graph;
    ConstraintSet cs;
    for (core::VertexId v = 1; v <= 66; ++v) {
        graph.add_edge(v, v + 1);
        if (v > 1) {
            cs.include_vertices.insert(v);
        }
    }
    ConstrainedPathSearch search(graph);
    auto result = search.find(1, 67, cs);
    EXPECT_EQ(result.code(), core::Error::Code::UNSUPPORTED);
}

TEST(ConstrainedPathLimitsTest, ExpansionBudgetAbortsSearch) {
    storage::Graph graph;
    for (core::VertexId v = 1; v < 10; ++v) {
        graph.add_edge(v, v + 1);
    }
    ConstrainedPathSearch search(graph, core::SearchConfig::Bounded(3));
    auto result = search.find(1, 10, ConstraintSet());
    EXPECT_EQ(result.code(), core::Error::Code::SEARCH_ABORTED);

    ConstrainedPathSearch unbounded(graph);
    auto path = unbounded.find(1, 10, ConstraintSet());
    ASSERT_TRUE(path.ok());
    ASSERT_TRUE(path.value().has_value());
    EXPECT_EQ(path.value()->length, 10u);
    EXPECT_EQ(unbounded.stats().expansions, 9u);
}

TEST(ConstrainedPathLimitsTest, CancelFlagAbortsSearch) {
    storage::Graph graph;
    graph.add_edge(1, 2);
    std::atomic<bool> cancel(true);
    core::SearchConfig config;
    config.cancel = &cancel;
    ConstrainedPathSearch search(graph, config);
    auto result = search.find(1, 2, ConstraintSet());
    EXPECT_EQ(result.code(), core::Error::Code::SEARCH_ABORTED);
}

} // namespace search
} // namespace hgraph
