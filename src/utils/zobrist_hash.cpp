// src/utils/zobrist_hash.cpp
#include "utils/zobrist_hash.h"
#include <random>
#include <stdexcept>
#include <string>

namespace uctsearch {
namespace utils {

ZobristHash::ZobristHash(int numPositions, int numPieceTypes, int numPlayers, uint64_t seed)
    : numPositions_(numPositions), numPieceTypes_(numPieceTypes), numPlayers_(numPlayers) {

    if (numPositions <= 0 || numPieceTypes <= 0 || numPlayers <= 0) {
        throw std::invalid_argument("Zobrist table dimensions must be positive: positions=" +
                                    std::to_string(numPositions) + " piece types=" +
                                    std::to_string(numPieceTypes) + " players=" +
                                    std::to_string(numPlayers));
    }

    std::mt19937_64 rng(seed);
    const size_t total = static_cast<size_t>(numPieceTypes) * numPositions + numPlayers;
    keys_.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        keys_.push_back(rng());
    }
}

uint64_t ZobristHash::getPieceHash(int pieceType, int position) const {
    if (pieceType < 0 || pieceType >= numPieceTypes_) {
        throw std::out_of_range("Piece type index out of range: " + std::to_string(pieceType));
    }
    if (position < 0 || position >= numPositions_) {
        throw std::out_of_range("Position index out of range: " + std::to_string(position));
    }
    return keys_[static_cast<size_t>(pieceType) * numPositions_ + position];
}

uint64_t ZobristHash::getPlayerHash(int player) const {
    if (player < 0 || player >= numPlayers_) {
        throw std::out_of_range("Player index out of range: " + std::to_string(player));
    }
    return keys_[static_cast<size_t>(numPieceTypes_) * numPositions_ + player];
}

uint64_t ZobristHash::hashPosition(const std::vector<int>& cells, int player) const {
    if (cells.size() != static_cast<size_t>(numPositions_)) {
        throw std::invalid_argument("Expected " + std::to_string(numPositions_) +
                                    " cells, got " + std::to_string(cells.size()));
    }

    uint64_t hash = getPlayerHash(player);
    for (int pos = 0; pos < numPositions_; ++pos) {
        if (cells[pos] != EMPTY_CELL) {
            hash ^= getPieceHash(cells[pos], pos);
        }
    }
    return hash;
}

} // namespace utils
} // namespace uctsearch
