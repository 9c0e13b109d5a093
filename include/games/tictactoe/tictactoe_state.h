// File: tictactoe_state.h
#ifndef UCTSEARCH_GAMES_TICTACTOE_STATE_H
#define UCTSEARCH_GAMES_TICTACTOE_STATE_H

#include "core/istate.h"
#include "core/export_macros.h"
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <random>
#include <cstdint>

namespace uctsearch {
namespace games {
namespace tictactoe {

constexpr int BOARD_SIZE = 3;
constexpr int NUM_CELLS = BOARD_SIZE * BOARD_SIZE;

constexpr double LOSS_REWARD = 0.0;
constexpr double TIE_REWARD = 0.5;
constexpr double WIN_REWARD = 1.0;

enum class Piece : int8_t {
    EMPTY = 0,
    X = 1,
    O = 2
};

// Cells indexed row by row:
// 0 1 2
// 3 4 5
// 6 7 8
using Board = std::array<Piece, NUM_CELLS>;

UCTSEARCH_API Piece opponent(Piece piece);
UCTSEARCH_API std::string pieceToString(Piece piece);

// Returns Piece::EMPTY if no line is complete
UCTSEARCH_API Piece findWinner(const Board& board);

// 0-based row and column to cell index
UCTSEARCH_API int rowColToIndex(int row, int col);

/**
 * @brief Immutable tic-tac-toe position with the player to move
 *
 * X moves first. Moves derive new states through makeMove(); an existing
 * state never changes.
 */
class UCTSEARCH_API TicTacToeState : public core::IState {
public:
    /**
     * @brief Constructor
     *
     * Winner and terminal flag are derived from the board.
     *
     * @param board Cell contents
     * @param turn Player to move (X or O)
     * @throws std::invalid_argument if turn is EMPTY
     */
    TicTacToeState(const Board& board, Piece turn);

    // Empty board, X to move
    static std::shared_ptr<const TicTacToeState> newGame();

    /**
     * @brief Build a position from a 9-character cell string
     *
     * Cells are given row by row as 'X', 'O', and '_' or '.' for empty,
     * e.g. "XX_OO____".
     *
     * @throws std::invalid_argument on a malformed string or an EMPTY turn
     */
    static std::shared_ptr<const TicTacToeState> fromString(const std::string& cells, Piece turn);

    /**
     * @brief Derive the state after the player to move takes a cell
     *
     * @param index Cell index in [0, 9)
     * @return New state with the other player to move
     * @throws core::IllegalMoveException if the game is over, the index is out
     *         of range or the cell is occupied
     */
    std::shared_ptr<const TicTacToeState> makeMove(int index) const;

    bool isLegalMove(int index) const;
    std::vector<int> getLegalMoves() const;

    // --- IState Interface Implementation ---
    std::vector<core::StatePtr> successors() const override;
    core::StatePtr randomSuccessor(std::mt19937& rng) const override;
    bool isTerminal() const override;
    double reward() const override;
    uint64_t getHash() const override;
    bool equals(const core::IState& other) const override;
    std::string toString() const override;

    const Board& getBoard() const { return board_; }
    Piece getCell(int index) const;
    Piece getTurn() const { return turn_; }
    Piece getWinner() const { return winner_; }

private:
    Board board_;
    Piece turn_;
    Piece winner_;
    bool terminal_;
    uint64_t hash_;

    uint64_t computeHash() const;
};

} // namespace tictactoe
} // namespace games
} // namespace uctsearch

#endif // UCTSEARCH_GAMES_TICTACTOE_STATE_H
