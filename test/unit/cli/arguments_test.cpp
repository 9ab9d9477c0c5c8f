#include <gtest/gtest.h>

#include "hgraph/cli/arguments.h"
#include "hgraph/cli/edge_patterns.h"

namespace hgraph {
namespace cli {

namespace {

Arguments parse(const std::vector<std::string>& tokens) {
    auto parsed = Arguments::parse(tokens);
    EXPECT_TRUE(parsed.ok()) << parsed.error();
    return parsed.ok() ? parsed.take_value() : Arguments();
}

} // namespace

TEST(ArgumentsTest, GroupsValuesUnderFlags) {
    auto args = parse({"--vertex", "1", "2", "--reverse", "--edge", "3", "4"});
    EXPECT_TRUE(args.has("reverse"));
    EXPECT_TRUE(args.values("reverse").empty());
    EXPECT_EQ(args.values("vertex"), (std::vector<std::string>{"1", "2"}));
    auto ids = args.vertex_ids("vertex");
    ASSERT_TRUE(ids.ok());
    EXPECT_EQ(ids.value(), (std::vector<core::VertexId>{1, 2}));
    EXPECT_FALSE(args.has("chain"));
    EXPECT_TRUE(args.values("chain").empty());
}

TEST(ArgumentsTest, RepeatedFlagAccumulates) {
    auto args = parse({"--edge", "1", "2", "--edge", "2", "3"});
    auto edges = args.edge_pairs("edge");
    ASSERT_TRUE(edges.ok());
    EXPECT_EQ(edges.value(), (std::vector<core::EdgeKey>{{1, 2}, {2, 3}}));
}

TEST(ArgumentsTest, StrayTokenIsUsageError) {
    auto parsed = Arguments::parse({"1", "--vertex", "2"});
    EXPECT_EQ(parsed.code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST(ArgumentsTest, RejectsBadVertexIds) {
    for (const std::string bad : {"0", "-1", "x", "1.5", "99999999999999999999999"}) {
        auto args = parse({"--vertex", bad});
        EXPECT_EQ(args.vertex_ids("vertex").code(), core::Error::Code::INVALID_ARGUMENT) << bad;
    }
    auto empty = parse({"--vertex"});
    EXPECT_FALSE(empty.vertex_ids("vertex").ok());
}

TEST(ArgumentsTest, OddEdgeListIsUsageError) {
    auto args = parse({"--edge", "1", "2", "3"});
    EXPECT_EQ(args.edge_pairs("edge").code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST(ArgumentsTest, ScalarValues) {
    auto args = parse({"--max-score", "-4", "--max-length", "7", "--path", "/tmp/g"});
    auto score = args.signed_value("max-score");
    ASSERT_TRUE(score.ok());
    EXPECT_EQ(score.value(), -4);
    auto length = args.unsigned_value("max-length");
    ASSERT_TRUE(length.ok());
    EXPECT_EQ(length.value(), 7u);
    auto path = args.string_value("path");
    ASSERT_TRUE(path.ok());
    EXPECT_EQ(path.value(), std::string("/tmp/g"));

    auto absent = args.unsigned_value("min-length");
    ASSERT_TRUE(absent.ok());
    EXPECT_FALSE(absent.value().has_value());

    EXPECT_FALSE(args.unsigned_value("max-score").ok());
    auto two = parse({"--max-length", "1", "2"});
    EXPECT_FALSE(two.unsigned_value("max-length").ok());
}

TEST(ArgumentsTest, ExpectOnlyAndSwitches) {
    auto args = parse({"--verbose", "--bogus", "1"});
    EXPECT_EQ(args.expect_only({"verbose"}).code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_TRUE(args.expect_only({"verbose", "bogus"}).ok());
    EXPECT_TRUE(args.expect_switch("verbose").ok());
    EXPECT_FALSE(args.expect_switch("bogus").ok());
}

TEST(EdgePatternsTest, Chain) {
    auto edges = chain_edges({1, 2, 3});
    ASSERT_TRUE(edges.ok());
    EXPECT_EQ(edges.value(), (std::vector<core::EdgeKey>{{1, 2}, {2, 3}}));
    EXPECT_FALSE(chain_edges({1}).ok());
}

TEST(EdgePatternsTest, Cycle) {
    auto edges = cycle_edges({1, 2, 3});
    ASSERT_TRUE(edges.ok());
    EXPECT_EQ(edges.value(), (std::vector<core::EdgeKey>{{1, 2}, {2, 3}, {3, 1}}));
    auto loop = cycle_edges({4});
    ASSERT_TRUE(loop.ok());
    EXPECT_EQ(loop.value(), (std::vector<core::EdgeKey>{{4, 4}}));
    EXPECT_FALSE(cycle_edges({}).ok());
}

TEST(EdgePatternsTest, StarAndClique) {
    auto star = star_edges({1, 2, 3});
    ASSERT_TRUE(star.ok());
    EXPECT_EQ(star.value(), (std::vector<core::EdgeKey>{{1, 2}, {1, 3}}));

    auto clique = clique_edges({1, 2, 3});
    ASSERT_TRUE(clique.ok());
    EXPECT_EQ(clique.value().size(), 6u);
    EXPECT_FALSE(clique_edges({1}).ok());
}

TEST(EdgePatternsTest, Reversed) {
    EXPECT_EQ(reversed({{1, 2}, {3, 4}}), (std::vector<core::EdgeKey>{{2, 1}, {4, 3}}));
}

} // namespace cli
} // namespace hgraph
