#include <gtest/gtest.h>

#include "hgraph/constraint/constraint_set.h"

namespace hgraph {
namespace constraint {

namespace {

storage::Graph square() {
    storage::Graph graph;
    graph.add_edge(1, 2);
    graph.add_edge(2, 3);
    graph.add_edge(3, 4);
    graph.add_edge(4, 1);
    return graph;
}

void expect_invalid(const core::Result<void>& result, const std::string& fragment) {
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::INVALID_CONSTRAINT);
    EXPECT_NE(result.error().find(fragment), std::string::npos) << result.error();
}

} // namespace

TEST(ConstraintSetTest, EmptyByDefault) {
    ConstraintSet cs;
    EXPECT_TRUE(cs.empty());
    cs.forbid_cycle = true;
    EXPECT_FALSE(cs.empty());
}

TEST(ConstraintSetTest, ExactBoundsWin) {
    ConstraintSet cs;
    cs.min_length = 2;
    cs.max_length = 6;
    EXPECT_EQ(cs.length_floor(), 2u);
    EXPECT_EQ(cs.length_ceiling(), 6u);
    cs.exact_length = 4;
    EXPECT_EQ(cs.length_floor(), 4u);
    EXPECT_EQ(cs.length_ceiling(), 4u);
    cs.max_score = 10;
    EXPECT_FALSE(cs.score_floor().has_value());
    EXPECT_EQ(cs.score_ceiling(), 10);
}

TEST(ConstraintSetTest, EmptySetIsValid) {
    auto graph = square();
    EXPECT_TRUE(validate_path_constraints(ConstraintSet(), graph, 1, 3).ok());
    EXPECT_TRUE(validate_cycle_constraints(ConstraintSet(), graph).ok());
}

TEST(ConstraintSetTest, ContradictoryBounds) {
    auto graph = square();
    ConstraintSet lengths;
    lengths.min_length = 6;
    lengths.max_length = 5;
    expect_invalid(validate_path_constraints(lengths, graph, 1, 3),
                   "Incompatible set of min/max length constraints: min=6, max=5");

    ConstraintSet scores;
    scores.min_score = 4;
    scores.max_score = 1;
    expect_invalid(validate_cycle_constraints(scores, graph), "min/max score");

    ConstraintSet exact;
    exact.exact_length = 9;
    exact.max_length = 5;
    expect_invalid(validate_path_constraints(exact, graph, 1, 3), "Exact length 9");
}

TEST(ConstraintSetTest, IncludedAndExcluded) {
    auto graph = square();
    ConstraintSet cs;
    cs.include_vertices = {2};
    cs.exclude_vertices = {2};
    expect_invalid(validate_path_constraints(cs, graph, 1, 3), "included and excluded");
    expect_invalid(validate_cycle_constraints(cs, graph), "included and excluded");

    ConstraintSet edges;
    edges.include_edges = {{1, 2}};
    edges.exclude_edges = {{1, 2}};
    expect_invalid(validate_cycle_constraints(edges, graph), "included and excluded");

    ConstraintSet endpoint;
    endpoint.include_edges = {{1, 2}};
    endpoint.exclude_vertices = {2};
    expect_invalid(validate_cycle_constraints(endpoint, graph), "endpoints is excluded");
}

TEST(ConstraintSetTest, ExcludedEndpoint) {
    auto graph = square();
    ConstraintSet cs;
    cs.exclude_vertices = {3};
    expect_invalid(validate_path_constraints(cs, graph, 1, 3), "endpoint 3 is excluded");
}

TEST(ConstraintSetTest, UnknownVertices) {
    auto graph = square();
    expect_invalid(validate_path_constraints(ConstraintSet(), graph, 1, 9), "Vertex 9 is not in the graph");

    ConstraintSet cs;
    cs.include_vertices = {8};
    expect_invalid(validate_cycle_constraints(cs, graph), "Included vertex 8");

    ConstraintSet edge;
    edge.include_edges = {{2, 1}};
    expect_invalid(validate_cycle_constraints(edge, graph), "Included edge (2, 1)");
}

TEST(ConstraintSetTest, OrderedVertices) {
    auto graph = square();
    ConstraintSet duplicate;
    duplicate.ordered_vertices = {2, 3, 2};
    expect_invalid(validate_path_constraints(duplicate, graph, 1, 4), "appears twice");

    ConstraintSet disjoint;
    disjoint.ordered_vertices = {2};
    disjoint.include_vertices = {3};
    expect_invalid(validate_path_constraints(disjoint, graph, 1, 4), "disjoint");

    ConstraintSet overlapping;
    overlapping.ordered_vertices = {2, 3};
    overlapping.include_vertices = {3};
    EXPECT_TRUE(validate_path_constraints(overlapping, graph, 1, 4).ok());
}

TEST(ConstraintSetTest, MandatoryVerticesMustFitLengthBound) {
    auto graph = square();
    ConstraintSet cs;
    cs.include_vertices = {2, 3};
    cs.max_length = 3;
    expect_invalid(validate_path_constraints(cs, graph, 1, 4), "4 mandatory vertices");
    cs.max_length = 4;
    EXPECT_TRUE(validate_path_constraints(cs, graph, 1, 4).ok());
}

TEST(ConstraintSetTest, QueryKindRestrictions) {
    auto graph = square();
    ConstraintSet both;
    both.require_cycle = true;
    both.forbid_cycle = true;
    expect_invalid(validate_path_constraints(both, graph, 1, 3), "cycle inclusion and exclusion");

    ConstraintSet edges;
    edges.include_edges = {{1, 2}};
    expect_invalid(validate_path_constraints(edges, graph, 1, 3), "only supported for cycle queries");

    ConstraintSet ordered;
    ordered.ordered_vertices = {1, 2};
    expect_invalid(validate_cycle_constraints(ordered, graph), "only supported for path queries");

    ConstraintSet presence;
    presence.require_cycle = true;
    expect_invalid(validate_cycle_constraints(presence, graph), "only supported for path queries");
}

TEST(ConstraintSetTest, UnsatisfiableButConsistentBoundsAreAccepted) {
    auto graph = square();
    ConstraintSet cs;
    cs.max_score = -1;
    EXPECT_TRUE(validate_path_constraints(cs, graph, 1, 3).ok());
    ConstraintSet zero;
    zero.max_length = 0;
    EXPECT_TRUE(validate_cycle_constraints(zero, graph).ok());
}

} // namespace constraint
} // namespace hgraph
