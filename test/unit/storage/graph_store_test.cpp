#include <gtest/gtest.h>

#include <filesystem>

#include "hgraph/storage/graph_store.h"
#include "test_util/temp_dir.h"

namespace hgraph {
namespace storage {

class GraphStoreTest : public testutil::StoreTestBase {
protected:
    void SetUp() override {
        StoreTestBase::SetUp();
        config_ = core::StoreConfig::AtRoot(root_.string());
        config_.sync_on_append = false;
    }

    core::StoreConfig config_;
};

TEST_F(GraphStoreTest, InitCreatesStoreLayout) {
    GraphStore store(config_);
    EXPECT_FALSE(store.exists());
    ASSERT_TRUE(store.init().ok());
    EXPECT_TRUE(store.exists());
    EXPECT_TRUE(std::filesystem::exists(root_ / ".graph" / "commands"));
}

TEST_F(GraphStoreTest, BuildReflectsMutations) {
    GraphStore store(config_);
    ASSERT_TRUE(store.init().ok());
    ASSERT_TRUE(store.add_vertices({1, 2, 3}).ok());
    ASSERT_TRUE(store.add_edges({{1, 2}, {2, 3}}, 3).ok());
    ASSERT_TRUE(store.remove_edges({{1, 2}}).ok());
    ASSERT_TRUE(store.remove_vertices({3}).ok());

    auto graph = store.build();
    ASSERT_TRUE(graph.ok()) << graph.error();
    EXPECT_EQ(graph.value().vertices(), (std::vector<core::VertexId>{1, 2}));
    EXPECT_EQ(graph.value().edge_count(), 0u);
}

TEST_F(GraphStoreTest, RejectsInvalidCommandsBeforeWriting) {
    GraphStore store(config_);
    ASSERT_TRUE(store.init().ok());

    auto zero_id = store.add_vertices({1, 0});
    EXPECT_EQ(zero_id.code(), core::Error::Code::INVALID_ARGUMENT);
    auto zero_weight = store.add_edges({{1, 2}}, 0);
    EXPECT_EQ(zero_weight.code(), core::Error::Code::INVALID_ARGUMENT);
    auto zero_target = store.remove_edges({{1, 0}});
    EXPECT_EQ(zero_target.code(), core::Error::Code::INVALID_ARGUMENT);

    auto commands = store.load();
    ASSERT_TRUE(commands.ok());
    EXPECT_TRUE(commands.value().empty());
}

TEST_F(GraphStoreTest, BuildWithoutInitIsIOError) {
    GraphStore store(config_);
    auto graph = store.build();
    EXPECT_EQ(graph.code(), core::Error::Code::IO_ERROR);
}

TEST_F(GraphStoreTest, CompactShrinksLogToCurrentGraph) {
    GraphStore store(config_);
    ASSERT_TRUE(store.init().ok());
    ASSERT_TRUE(store.add_edges({{1, 2}, {2, 3}, {3, 1}}).ok());
    ASSERT_TRUE(store.remove_vertices({3}).ok());
    ASSERT_TRUE(store.add_edges({{2, 1}}).ok());

    auto before = store.build();
    ASSERT_TRUE(before.ok());
    auto compacted = store.compact();
    ASSERT_TRUE(compacted.ok()) << compacted.error();
    EXPECT_EQ(compacted.value(), before.value());

    auto commands = store.load();
    ASSERT_TRUE(commands.ok());
    const std::vector<core::Command> expected = {
        core::Command::AddVertex(1), core::Command::AddVertex(2),
        core::Command::AddEdge(1, 2), core::Command::AddEdge(2, 1)};
    EXPECT_EQ(commands.value(), expected);

    auto after = store.build();
    ASSERT_TRUE(after.ok());
    EXPECT_EQ(after.value(), before.value());
}

TEST_F(GraphStoreTest, CleanRemovesStore) {
    GraphStore store(config_);
    ASSERT_TRUE(store.init().ok());
    ASSERT_TRUE(store.add_vertices({1}).ok());
    ASSERT_TRUE(store.clean().ok());
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(root_ / ".graph"));

    ASSERT_TRUE(store.init().ok());
    auto graph = store.build();
    ASSERT_TRUE(graph.ok());
    EXPECT_TRUE(graph.value().empty());
}

} // namespace storage
} // namespace hgraph
