#include <gtest/gtest.h>

#include "hgraph/constraint/checker.h"

namespace hgraph {
namespace constraint {

class CheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_.add_edge(1, 2);
        graph_.add_edge(2, 3, 2);
        graph_.add_edge(3, 1);
        graph_.add_edge(3, 4);
    }

    storage::Graph graph_;
};

TEST_F(CheckerTest, AcceptsConsistentPath) {
    core::PathResult path({1, 2, 3, 4}, 4, 4);
    EXPECT_TRUE(check_path(graph_, path, ConstraintSet(), 1, 4).ok());
}

TEST_F(CheckerTest, RejectsWrongEndpointsOrMissingEdge) {
    EXPECT_EQ(check_path(graph_, core::PathResult({2, 3, 4}, 3, 3), ConstraintSet(), 1, 4).code(),
              core::Error::Code::INTERNAL);
    EXPECT_FALSE(check_path(graph_, core::PathResult({1, 3, 4}, 3, 2), ConstraintSet(), 1, 4).ok());
}

TEST_F(CheckerTest, RejectsMisreportedScoreOrLength) {
    auto score = check_path(graph_, core::PathResult({1, 2, 3}, 3, 2), ConstraintSet(), 1, 3);
    EXPECT_NE(score.error().find("score"), std::string::npos);
    auto length = check_path(graph_, core::PathResult({1, 2, 3}, 2, 3), ConstraintSet(), 1, 3);
    EXPECT_NE(length.error().find("length"), std::string::npos);
}

TEST_F(CheckerTest, ChecksEveryPredicate) {
    core::PathResult path({1, 2, 3, 1, 2, 3, 4}, 7, 8);

    ConstraintSet excluded;
    excluded.exclude_edges = {{2, 3}};
    EXPECT_FALSE(check_path(graph_, path, excluded, 1, 4).ok());

    ConstraintSet no_cycle;
    no_cycle.forbid_cycle = true;
    EXPECT_FALSE(check_path(graph_, path, no_cycle, 1, 4).ok());

    ConstraintSet with_cycle;
    with_cycle.require_cycle = true;
    EXPECT_TRUE(check_path(graph_, path, with_cycle, 1, 4).ok());

    ConstraintSet short_only;
    short_only.max_length = 5;
    EXPECT_FALSE(check_path(graph_, path, short_only, 1, 4).ok());

    ConstraintSet cheap;
    cheap.max_score = 7;
    EXPECT_FALSE(check_path(graph_, path, cheap, 1, 4).ok());
}

TEST(RespectsOrderTest, FirstVisitsFollowOrder) {
    EXPECT_TRUE(respects_order({1, 5, 2, 6, 3}, {5, 6}));
    EXPECT_FALSE(respects_order({1, 6, 5}, {5, 6}));
    EXPECT_TRUE(respects_order({5, 5, 6, 6}, {5, 6}));
    EXPECT_FALSE(respects_order({5, 6, 5}, {5, 6}));
    EXPECT_TRUE(respects_order({1, 2}, {}));
}

TEST_F(CheckerTest, OrderedVerticesAreMandatory) {
    ConstraintSet cs;
    cs.ordered_vertices = {2, 3};
    EXPECT_TRUE(check_path(graph_, core::PathResult({1, 2, 3, 4}, 4, 4), cs, 1, 4).ok());
    cs.ordered_vertices = {3, 2};
    EXPECT_FALSE(check_path(graph_, core::PathResult({1, 2, 3, 4}, 4, 4), cs, 1, 4).ok());
}

TEST_F(CheckerTest, CycleChecks) {
    core::PathResult triangle({1, 2, 3, 1}, 3, 4);
    EXPECT_TRUE(check_cycle(graph_, triangle, ConstraintSet()).ok());

    ConstraintSet edge;
    edge.include_edges = {{3, 1}};
    EXPECT_TRUE(check_cycle(graph_, triangle, edge).ok());
    edge.include_edges = {{3, 4}};
    EXPECT_FALSE(check_cycle(graph_, triangle, edge).ok());

    EXPECT_FALSE(check_cycle(graph_, core::PathResult({1, 2, 3}, 3, 3), ConstraintSet()).ok());
}

} // namespace constraint
} // namespace hgraph
