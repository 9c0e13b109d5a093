// src/cli/play_command.cpp
#include "cli/play_command.h"
#include "cli/cli_manager.h"
#include "games/tictactoe/tictactoe_state.h"
#include "utils/logger.h"
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace uctsearch {
namespace cli {

using games::tictactoe::TicTacToeState;
using games::tictactoe::Piece;

SearchResult runSearch(mcts::MCTSEngine& engine,
                       const core::StatePtr& state,
                       const utils::SearchBudget& budget) {
    using Clock = std::chrono::steady_clock;

    const auto start = Clock::now();
    const auto deadline = start + std::chrono::milliseconds(budget.time_budget_ms);

    SearchResult result;
    while (true) {
        if (budget.rollouts_per_move > 0 && result.rollouts >= budget.rollouts_per_move) {
            break;
        }
        if (budget.time_budget_ms > 0 && Clock::now() >= deadline) {
            break;
        }
        if (budget.rollouts_per_move == 0 && budget.time_budget_ms == 0) {
            break;
        }
        engine.rollout(state);
        ++result.rollouts;
    }

    result.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();

    utils::SearchLogData log_data{result.rollouts, engine.getStore().numTracked(),
                                  engine.getStore().numExpanded(), result.elapsed_ms};
    LOG_MCTS_DEBUG("search finished: {}", log_data.toString());
    return result;
}

std::optional<int> parseMoveInput(const std::string& line) {
    std::istringstream ss(line);
    int row = 0;
    int col = 0;
    char separator = '\0';

    if (!(ss >> row >> separator >> col) || separator != ',') {
        return std::nullopt;
    }
    std::string rest;
    if (ss >> rest) {
        return std::nullopt;
    }
    if (row < 1 || row > games::tictactoe::BOARD_SIZE ||
        col < 1 || col > games::tictactoe::BOARD_SIZE) {
        return std::nullopt;
    }
    return games::tictactoe::rowColToIndex(row - 1, col - 1);
}

int playGame(mcts::MCTSEngine& engine,
             const utils::SearchBudget& budget,
             std::istream& in,
             std::ostream& out) {
    std::shared_ptr<const TicTacToeState> board = TicTacToeState::newGame();
    out << board->toString() << std::endl;

    while (!board->isTerminal()) {
        out << "enter row,col: " << std::flush;
        std::string line;
        if (!std::getline(in, line)) {
            out << std::endl << "Input closed, abandoning game" << std::endl;
            LOG_GAME_WARN("input closed before the game finished");
            return exit_code::FAILURE;
        }

        std::optional<int> index = parseMoveInput(line);
        if (!index) {
            out << "Invalid input, expected row,col with values 1-"
                << games::tictactoe::BOARD_SIZE << std::endl;
            continue;
        }
        if (!board->isLegalMove(*index)) {
            out << "Invalid move, spot already taken" << std::endl;
            continue;
        }

        board = board->makeMove(*index);
        LOG_GAME_DEBUG("human played cell {}", *index);
        out << board->toString() << std::endl;

        if (board->isTerminal()) {
            break;
        }

        // Train as we go: search from the current position before every reply
        SearchResult search = runSearch(engine, board, budget);
        core::StatePtr reply = engine.choose(board);
        board = std::dynamic_pointer_cast<const TicTacToeState>(reply);
        if (!board) {
            throw core::InvalidOperationException("engine returned a state of another game");
        }
        LOG_GAME_DEBUG("engine replied after {} rollouts", search.rollouts);
        out << board->toString() << std::endl;
    }

    out << "Game over" << std::endl;
    if (board->getWinner() == Piece::EMPTY) {
        out << "Tie" << std::endl;
    } else {
        out << games::tictactoe::pieceToString(board->getWinner()) << " wins!" << std::endl;
    }
    LOG_GAME_INFO("game finished, winner: {}", games::tictactoe::pieceToString(board->getWinner()));
    return exit_code::SUCCESS;
}

int runPlayCommand(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        throw std::invalid_argument("play takes at most one argument, the config file");
    }

    utils::AppConfig config;
    if (!args.empty()) {
        try {
            config = utils::loadConfig(args[0]);
        } catch (const YAML::Exception& e) {
            // Out-of-range values throw std::invalid_argument and surface as usage errors
            LOG_SYSTEM_ERROR("Failed to read config file {}: {}", args[0], e.what());
            return exit_code::FAILURE;
        }
    }

    utils::Logger::init(utils::toLoggerOptions(config.logging));

    mcts::MCTSEngine engine(config.mcts);
    LOG_SYSTEM_INFO("Starting game: rollouts_per_move={} time_budget_ms={} seed={}",
                    config.search.rollouts_per_move, config.search.time_budget_ms,
                    engine.getSeed());

    int status = playGame(engine, config.search, std::cin, std::cout);
    utils::Logger::flush_all();
    return status;
}

} // namespace cli
} // namespace uctsearch
