// File: tictactoe_state.cpp
#include "games/tictactoe/tictactoe_state.h"
#include "utils/zobrist_hash.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace uctsearch {
namespace games {
namespace tictactoe {

namespace {

// Three in a row, three in a column, both diagonals
constexpr std::array<std::array<int, 3>, 8> WINNING_LINES = {{
    {{0, 1, 2}}, {{3, 4, 5}}, {{6, 7, 8}},
    {{0, 3, 6}}, {{1, 4, 7}}, {{2, 5, 8}},
    {{0, 4, 8}}, {{2, 4, 6}}
}};

constexpr uint64_t ZOBRIST_SEED = 0x7a3c9e15b2d4f681ULL;

const utils::ZobristHash& zobristTable() {
    static const utils::ZobristHash table(NUM_CELLS, 2, 2, ZOBRIST_SEED);
    return table;
}

int pieceIndex(Piece piece) {
    return piece == Piece::X ? 0 : 1;
}

} // anonymous namespace

Piece opponent(Piece piece) {
    switch (piece) {
        case Piece::X: return Piece::O;
        case Piece::O: return Piece::X;
        default: return Piece::EMPTY;
    }
}

std::string pieceToString(Piece piece) {
    switch (piece) {
        case Piece::X: return "X";
        case Piece::O: return "O";
        default: return "_";
    }
}

Piece findWinner(const Board& board) {
    for (const auto& line : WINNING_LINES) {
        Piece first = board[line[0]];
        if (first != Piece::EMPTY && board[line[1]] == first && board[line[2]] == first) {
            return first;
        }
    }
    return Piece::EMPTY;
}

int rowColToIndex(int row, int col) {
    if (row < 0 || row >= BOARD_SIZE || col < 0 || col >= BOARD_SIZE) {
        throw std::out_of_range("Row/column out of range: " + std::to_string(row) +
                                "," + std::to_string(col));
    }
    return row * BOARD_SIZE + col;
}

// --- Constructor ---
TicTacToeState::TicTacToeState(const Board& board, Piece turn)
    : board_(board),
      turn_(turn),
      winner_(findWinner(board)),
      terminal_(false),
      hash_(0) {

    if (turn_ == Piece::EMPTY) {
        throw std::invalid_argument("Player to move must be X or O");
    }
    bool board_full = std::none_of(board_.begin(), board_.end(),
                                   [](Piece p) { return p == Piece::EMPTY; });
    terminal_ = winner_ != Piece::EMPTY || board_full;
    hash_ = computeHash();
}

std::shared_ptr<const TicTacToeState> TicTacToeState::newGame() {
    Board board;
    board.fill(Piece::EMPTY);
    return std::make_shared<const TicTacToeState>(board, Piece::X);
}

std::shared_ptr<const TicTacToeState> TicTacToeState::fromString(const std::string& cells, Piece turn) {
    if (cells.size() != static_cast<size_t>(NUM_CELLS)) {
        throw std::invalid_argument("Board string must have " + std::to_string(NUM_CELLS) +
                                    " cells, got " + std::to_string(cells.size()));
    }

    Board board;
    for (int i = 0; i < NUM_CELLS; ++i) {
        switch (cells[i]) {
            case 'X': case 'x': board[i] = Piece::X; break;
            case 'O': case 'o': board[i] = Piece::O; break;
            case '_': case '.': case '-': board[i] = Piece::EMPTY; break;
            default:
                throw std::invalid_argument(std::string("Invalid cell character '") + cells[i] + "'");
        }
    }
    return std::make_shared<const TicTacToeState>(board, turn);
}

std::shared_ptr<const TicTacToeState> TicTacToeState::makeMove(int index) const {
    if (terminal_) {
        throw core::IllegalMoveException("Game is already over", index);
    }
    if (index < 0 || index >= NUM_CELLS) {
        throw core::IllegalMoveException("Cell index out of range", index);
    }
    if (board_[index] != Piece::EMPTY) {
        throw core::IllegalMoveException("Cell already taken", index);
    }

    Board next = board_;
    next[index] = turn_;
    return std::make_shared<const TicTacToeState>(next, opponent(turn_));
}

bool TicTacToeState::isLegalMove(int index) const {
    return !terminal_ && index >= 0 && index < NUM_CELLS && board_[index] == Piece::EMPTY;
}

std::vector<int> TicTacToeState::getLegalMoves() const {
    std::vector<int> moves;
    if (terminal_) {
        return moves;
    }
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (board_[i] == Piece::EMPTY) {
            moves.push_back(i);
        }
    }
    return moves;
}

Piece TicTacToeState::getCell(int index) const {
    if (index < 0 || index >= NUM_CELLS) {
        throw std::out_of_range("Cell index out of range: " + std::to_string(index));
    }
    return board_[index];
}

// --- IState Interface ---

std::vector<core::StatePtr> TicTacToeState::successors() const {
    std::vector<core::StatePtr> result;
    for (int move : getLegalMoves()) {
        result.push_back(makeMove(move));
    }
    return result;
}

core::StatePtr TicTacToeState::randomSuccessor(std::mt19937& rng) const {
    if (terminal_) {
        throw core::InvalidOperationException("random successor requested from finished game");
    }
    std::vector<int> moves = getLegalMoves();
    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    return makeMove(moves[dist(rng)]);
}

bool TicTacToeState::isTerminal() const {
    return terminal_;
}

double TicTacToeState::reward() const {
    if (!terminal_) {
        throw core::InvalidOperationException("reward called on nonterminal board\n" + toString());
    }
    if (winner_ == turn_) {
        // The player to move cannot have completed a line on the opponent's turn
        throw core::InvalidOperationException("reward called on unreachable board\n" + toString());
    }
    if (winner_ == opponent(turn_)) {
        return LOSS_REWARD;
    }
    return TIE_REWARD;
}

uint64_t TicTacToeState::getHash() const {
    return hash_;
}

uint64_t TicTacToeState::computeHash() const {
    std::vector<int> cells(NUM_CELLS, utils::ZobristHash::EMPTY_CELL);
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (board_[i] != Piece::EMPTY) {
            cells[i] = pieceIndex(board_[i]);
        }
    }
    return zobristTable().hashPosition(cells, pieceIndex(turn_));
}

bool TicTacToeState::equals(const core::IState& other) const {
    const auto* other_state = dynamic_cast<const TicTacToeState*>(&other);
    if (!other_state) {
        return false;
    }
    return turn_ == other_state->turn_ && board_ == other_state->board_;
}

std::string TicTacToeState::toString() const {
    std::stringstream ss;
    ss << " ";
    for (int col = 0; col < BOARD_SIZE; ++col) {
        ss << " " << (col + 1);
    }
    ss << "\n";
    for (int row = 0; row < BOARD_SIZE; ++row) {
        ss << (row + 1);
        for (int col = 0; col < BOARD_SIZE; ++col) {
            ss << " " << pieceToString(board_[rowColToIndex(row, col)]);
        }
        ss << "\n";
    }
    return ss.str();
}

} // namespace tictactoe
} // namespace games
} // namespace uctsearch
