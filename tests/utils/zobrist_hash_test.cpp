// tests/utils/zobrist_hash_test.cpp
#include <gtest/gtest.h>
#include "utils/zobrist_hash.h"
#include <set>

using namespace uctsearch::utils;

TEST(ZobristHashTest, SameSeedGivesSameKeys) {
    ZobristHash a(9, 2, 2, 12345);
    ZobristHash b(9, 2, 2, 12345);

    for (int piece = 0; piece < 2; ++piece) {
        for (int pos = 0; pos < 9; ++pos) {
            EXPECT_EQ(a.getPieceHash(piece, pos), b.getPieceHash(piece, pos));
        }
    }
    EXPECT_EQ(a.getPlayerHash(0), b.getPlayerHash(0));
    EXPECT_EQ(a.getPlayerHash(1), b.getPlayerHash(1));
}

TEST(ZobristHashTest, KeysAreDistinct) {
    ZobristHash hash(9, 2, 2, 99);
    std::set<uint64_t> keys;
    for (int piece = 0; piece < 2; ++piece) {
        for (int pos = 0; pos < 9; ++pos) {
            keys.insert(hash.getPieceHash(piece, pos));
        }
    }
    keys.insert(hash.getPlayerHash(0));
    keys.insert(hash.getPlayerHash(1));
    EXPECT_EQ(keys.size(), 20u);
}

TEST(ZobristHashTest, DifferentSeedsDiffer) {
    ZobristHash a(9, 2, 2, 1);
    ZobristHash b(9, 2, 2, 2);
    EXPECT_NE(a.getPieceHash(0, 0), b.getPieceHash(0, 0));
}

TEST(ZobristHashTest, Dimensions) {
    ZobristHash hash(9, 2, 2, 7);
    EXPECT_EQ(hash.getNumPositions(), 9);
    EXPECT_EQ(hash.getNumPieceTypes(), 2);
    EXPECT_EQ(hash.getNumPlayers(), 2);
}

TEST(ZobristHashTest, OutOfRangeIndexesThrow) {
    ZobristHash hash(9, 2, 2, 7);
    EXPECT_THROW(hash.getPieceHash(2, 0), std::out_of_range);
    EXPECT_THROW(hash.getPieceHash(-1, 0), std::out_of_range);
    EXPECT_THROW(hash.getPieceHash(0, 9), std::out_of_range);
    EXPECT_THROW(hash.getPlayerHash(2), std::out_of_range);
}

TEST(ZobristHashTest, InvalidDimensionsThrow) {
    EXPECT_THROW(ZobristHash(0, 2, 2, 7), std::invalid_argument);
    EXPECT_THROW(ZobristHash(9, 0, 2, 7), std::invalid_argument);
    EXPECT_THROW(ZobristHash(9, 2, -1, 7), std::invalid_argument);
}

TEST(ZobristHashTest, HashPositionXorsOccupiedCells) {
    ZobristHash hash(4, 2, 2, 11);
    const int E = ZobristHash::EMPTY_CELL;

    EXPECT_EQ(hash.hashPosition({E, E, E, E}, 0), hash.getPlayerHash(0));
    EXPECT_EQ(hash.hashPosition({0, E, 1, E}, 1),
              hash.getPlayerHash(1) ^ hash.getPieceHash(0, 0) ^ hash.getPieceHash(1, 2));
}

TEST(ZobristHashTest, HashPositionValidatesInput) {
    ZobristHash hash(4, 2, 2, 11);
    EXPECT_THROW(hash.hashPosition({0, 1}, 0), std::invalid_argument);
    EXPECT_THROW(hash.hashPosition({0, 0, 0, 2}, 0), std::out_of_range);
    EXPECT_THROW(hash.hashPosition({0, 0, 0, 0}, 2), std::out_of_range);
}
