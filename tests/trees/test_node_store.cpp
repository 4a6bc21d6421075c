/**
 * @file test_node_store.cpp
 * @brief Тесты арены узлов
 */

#include <gtest/gtest.h>

#include "trees/node_store.hpp"

namespace arbor::trees::test {

namespace {

struct TestNode {
    uint64_t payload{0};
};

} // anonymous namespace

TEST(NodeStoreTest, StartsEmpty) {
    NodeStore<TestNode> store;

    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.nodes_count(), 0u);
    EXPECT_EQ(store.get(0).payload, 0u);
}

TEST(NodeStoreTest, IdsAreDenseAndStartAtOne) {
    NodeStore<TestNode> store;

    EXPECT_EQ(store.allocate(TestNode{10}), 1u);
    EXPECT_EQ(store.allocate(TestNode{20}), 2u);
    EXPECT_EQ(store.allocate(TestNode{30}), 3u);

    EXPECT_EQ(store.get(2).payload, 20u);
    EXPECT_EQ(store.nodes_count(), 3u);
    EXPECT_EQ(store.live_count(), 3u);
}

TEST(NodeStoreTest, UnknownIdReturnsEmptyNode) {
    NodeStore<TestNode> store;
    (void)store.allocate(TestNode{10});

    EXPECT_EQ(store.get(42).payload, 0u);
}

TEST(NodeStoreTest, TombstoneKeepsIdsUnique) {
    NodeStore<TestNode> store;
    (void)store.allocate(TestNode{10});
    const NodeId second = store.allocate(TestNode{20});

    store.tombstone(second);

    EXPECT_EQ(store.get(second).payload, 0u);
    EXPECT_EQ(store.deleted_count(), 1u);
    EXPECT_EQ(store.live_count(), 1u);

    // Удалённый id не переиспользуется
    EXPECT_EQ(store.allocate(TestNode{30}), 3u);
}

TEST(NodeStoreTest, TombstoneOfNullIsIgnored) {
    NodeStore<TestNode> store;
    store.tombstone(0);

    EXPECT_EQ(store.deleted_count(), 0u);
}

TEST(NodeStoreTest, SetAndAt) {
    NodeStore<TestNode> store;
    const NodeId id = store.allocate(TestNode{1});

    store.set(id, TestNode{2});
    EXPECT_EQ(store.get(id).payload, 2u);

    store.at(id).payload = 3;
    EXPECT_EQ(store.get(id).payload, 3u);

    // Слот 0 не изменяется через set()
    store.set(0, TestNode{99});
    EXPECT_EQ(store.get(0).payload, 0u);
}

} // namespace arbor::trees::test
