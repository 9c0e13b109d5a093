// tests/mcts/mcts_scenarios_test.cpp
#include <gtest/gtest.h>
#include "mcts/mcts_engine.h"
#include "games/tictactoe/tictactoe_state.h"
#include <memory>

using namespace uctsearch;
using namespace uctsearch::mcts;
using games::tictactoe::Piece;
using games::tictactoe::TicTacToeState;

namespace {

MCTSEngine seededEngine(int64_t seed) {
    MCTSSettings settings;
    settings.seed = seed;
    return MCTSEngine(settings);
}

// Number of trials out of `trials` in which the engine finds the winning cell
int countWinningChoices(const std::shared_ptr<const TicTacToeState>& root,
                        int winning_cell, int trials, int rollouts) {
    int wins = 0;
    for (int trial = 0; trial < trials; ++trial) {
        MCTSEngine engine = seededEngine(1000 + trial);
        for (int i = 0; i < rollouts; ++i) {
            engine.rollout(root);
        }
        auto chosen = std::dynamic_pointer_cast<const TicTacToeState>(engine.choose(root));
        if (chosen && chosen->getCell(winning_cell) == root->getTurn()) {
            ++wins;
        }
    }
    return wins;
}

} // anonymous namespace

TEST(MCTSScenarioTest, SingleRolloutFromEmptyBoard) {
    MCTSEngine engine = seededEngine(17);
    core::StatePtr root = TicTacToeState::newGame();

    engine.rollout(root);

    EXPECT_EQ(engine.getStore().getVisits(root), 1);
    double q = engine.getStore().getTotalReward(root);
    EXPECT_TRUE(q == 0.0 || q == 0.5 || q == 1.0) << q;
    EXPECT_TRUE(engine.getStore().isExpanded(root));
    EXPECT_EQ(engine.getStore().getChildren(root).size(), 9u);
}

TEST(MCTSScenarioTest, FindsImmediateWinListedFirst) {
    // X to move, X completes the top row at cell 2
    auto root = TicTacToeState::fromString("XX_OO____", Piece::X);
    EXPECT_EQ(countWinningChoices(root, 2, 20, 200), 20);
}

TEST(MCTSScenarioTest, FindsImmediateWinListedLater) {
    // X to move, X completes the middle row at cell 5; cell 2 only blocks O
    auto root = TicTacToeState::fromString("OO_XX____", Piece::X);
    EXPECT_GE(countWinningChoices(root, 5, 20, 200), 18);
}

TEST(MCTSScenarioTest, BlocksOpponentsWinningLine) {
    // O to move, X threatens cell 2; every other move loses at once
    auto root = TicTacToeState::fromString("XX_O_____", Piece::O);
    int blocks = 0;
    for (int trial = 0; trial < 10; ++trial) {
        MCTSEngine engine = seededEngine(500 + trial);
        for (int i = 0; i < 1000; ++i) {
            engine.rollout(root);
        }
        auto chosen = std::dynamic_pointer_cast<const TicTacToeState>(engine.choose(root));
        if (chosen && chosen->getCell(2) == Piece::O) {
            ++blocks;
        }
    }
    EXPECT_GE(blocks, 8);
}

TEST(MCTSScenarioTest, TerminalRoot) {
    // X completed the top row, O to move
    auto root = TicTacToeState::fromString("XXXOO____", Piece::O);
    ASSERT_TRUE(root->isTerminal());

    MCTSEngine engine = seededEngine(23);
    EXPECT_THROW(engine.choose(root), core::InvalidOperationException);

    // The terminal root is its own leaf; O lost, so the player who moved in gets 1
    engine.rollout(root);
    engine.rollout(root);
    EXPECT_EQ(engine.getStore().getVisits(root), 2);
    EXPECT_DOUBLE_EQ(engine.getStore().getTotalReward(root), 2 * games::tictactoe::WIN_REWARD);
    EXPECT_TRUE(engine.getStore().getChildren(root).empty());

    EXPECT_THROW(engine.choose(root), core::InvalidOperationException);
}

TEST(MCTSScenarioTest, StatisticsCarryOverToLaterPositions) {
    MCTSEngine engine = seededEngine(31);
    auto root = TicTacToeState::newGame();
    for (int i = 0; i < 300; ++i) {
        engine.rollout(root);
    }

    // The centre opening was explored from the empty board
    auto centre = root->makeMove(4);
    int visits_before = engine.getStore().getVisits(centre);
    ASSERT_GT(visits_before, 0);

    for (int i = 0; i < 10; ++i) {
        engine.rollout(centre);
    }
    EXPECT_EQ(engine.getStore().getVisits(centre), visits_before + 10);
}
