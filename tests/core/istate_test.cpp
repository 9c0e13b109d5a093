// tests/core/istate_test.cpp
#include <gtest/gtest.h>
#include "core/istate.h"
#include "mcts/graph_state.h"
#include <unordered_set>

using namespace uctsearch;
using uctsearch::testing::GameGraph;
using uctsearch::testing::GraphState;

TEST(IStateTest, HashAndEqualityFollowStructure) {
    auto graph = std::make_shared<const GameGraph>();
    core::StatePtr a = GraphState::make(graph, 3);
    core::StatePtr b = GraphState::make(graph, 3);
    core::StatePtr c = GraphState::make(graph, 4);

    core::StatePtrHash hash;
    core::StatePtrEqual equal;

    EXPECT_EQ(hash(a), hash(b));
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, c));
}

TEST(IStateTest, NullPointersCompareOnlyToNull) {
    auto graph = std::make_shared<const GameGraph>();
    core::StatePtr a = GraphState::make(graph, 1);

    core::StatePtrEqual equal;
    EXPECT_TRUE(equal(nullptr, nullptr));
    EXPECT_FALSE(equal(a, nullptr));
    EXPECT_FALSE(equal(nullptr, a));
    EXPECT_EQ(core::StatePtrHash()(nullptr), 0u);
}

TEST(IStateTest, StatesFromDifferentGraphsDiffer) {
    auto first = std::make_shared<const GameGraph>();
    auto second = std::make_shared<const GameGraph>();

    core::StatePtrEqual equal;
    EXPECT_FALSE(equal(GraphState::make(first, 1), GraphState::make(second, 1)));
}

TEST(IStateTest, UsableAsUnorderedSetKey) {
    auto graph = std::make_shared<const GameGraph>();
    std::unordered_set<core::StatePtr, core::StatePtrHash, core::StatePtrEqual> seen;

    EXPECT_TRUE(seen.insert(GraphState::make(graph, 1)).second);
    EXPECT_FALSE(seen.insert(GraphState::make(graph, 1)).second);
    EXPECT_TRUE(seen.insert(GraphState::make(graph, 2)).second);
    EXPECT_EQ(seen.size(), 2u);
}
