// include/cli/play_command.h
#ifndef UCTSEARCH_CLI_PLAY_COMMAND_H
#define UCTSEARCH_CLI_PLAY_COMMAND_H

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "core/istate.h"
#include "core/export_macros.h"
#include "mcts/mcts_engine.h"
#include "utils/config.h"

namespace uctsearch {
namespace cli {

struct UCTSEARCH_API SearchResult {
    int rollouts = 0;
    double elapsed_ms = 0.0;
};

/**
 * @brief Run rollouts from state until the budget is spent
 *
 * Stops at whichever of the rollout count and the deadline is reached first;
 * a zero limit is ignored. The deadline is checked between rollouts only.
 */
UCTSEARCH_API SearchResult runSearch(mcts::MCTSEngine& engine,
                                     const core::StatePtr& state,
                                     const utils::SearchBudget& budget);

/**
 * @brief Parse a 1-based "row,col" move into a cell index
 *
 * @return Cell index, or nullopt if the text is malformed or off the board
 */
UCTSEARCH_API std::optional<int> parseMoveInput(const std::string& line);

/**
 * @brief Play one game of tic-tac-toe, human (X) against the engine (O)
 *
 * Reads moves from in, writes boards and prompts to out. The engine searches
 * with the given budget before each of its moves and keeps its statistics
 * between moves.
 *
 * @return exit_code::SUCCESS when the game finished, exit_code::FAILURE if
 *         input ended first
 */
UCTSEARCH_API int playGame(mcts::MCTSEngine& engine,
                           const utils::SearchBudget& budget,
                           std::istream& in,
                           std::ostream& out);

// "play [config.yaml]" command handler
UCTSEARCH_API int runPlayCommand(const std::vector<std::string>& args);

} // namespace cli
} // namespace uctsearch

#endif // UCTSEARCH_CLI_PLAY_COMMAND_H
