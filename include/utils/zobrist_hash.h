// include/utils/zobrist_hash.h
#ifndef UCTSEARCH_UTILS_ZOBRIST_HASH_H
#define UCTSEARCH_UTILS_ZOBRIST_HASH_H

#include <cstdint>
#include <vector>
#include "core/export_macros.h"

namespace uctsearch {
namespace utils {

/**
 * @brief Zobrist key table for board positions
 *
 * Holds one 64-bit key per (piece type, cell) and one per player to move.
 * A position hashes to the XOR of the keys of its occupied cells and the key
 * of the player to move, so transpositions hash equal.
 *
 * Keys are the raw output of std::mt19937_64 seeded with `seed`, which the
 * standard fixes exactly; a table is identical across runs and platforms.
 */
class UCTSEARCH_API ZobristHash {
public:
    // Cell value meaning "no piece" in hashPosition()
    static constexpr int EMPTY_CELL = -1;

    /**
     * @throws std::invalid_argument if any dimension is not positive
     */
    ZobristHash(int numPositions, int numPieceTypes, int numPlayers, uint64_t seed);

    // @throws std::out_of_range on a bad index
    uint64_t getPieceHash(int pieceType, int position) const;
    uint64_t getPlayerHash(int player) const;

    /**
     * @brief Hash a whole position
     *
     * @param cells Piece type per cell, EMPTY_CELL for empty; size must be
     *              getNumPositions()
     * @param player Player to move
     * @throws std::invalid_argument on a size mismatch
     * @throws std::out_of_range on a bad piece type or player
     */
    uint64_t hashPosition(const std::vector<int>& cells, int player) const;

    int getNumPositions() const { return numPositions_; }
    int getNumPieceTypes() const { return numPieceTypes_; }
    int getNumPlayers() const { return numPlayers_; }

private:
    int numPositions_;
    int numPieceTypes_;
    int numPlayers_;

    // Piece keys row-major by piece type, then one key per player
    std::vector<uint64_t> keys_;
};

} // namespace utils
} // namespace uctsearch

#endif // UCTSEARCH_UTILS_ZOBRIST_HASH_H
