#include <gtest/gtest.h>

#include "core/Board.hpp"

#include <unordered_set>

using namespace ms;

TEST(BoardTests, PlacesRequestedNumberOfMines) {
    RNG rng; rng.seed(99);
    Board board(Params{ 8, 8, 10 }, rng);

    EXPECT_EQ(board.mines().size(), 10u);
    int counted = 0;
    for (int r = 0; r < 8; ++r)
        for (int c = 0; c < 8; ++c)
            if (board.isMine({ r, c })) ++counted;
    EXPECT_EQ(counted, 10);
}

TEST(BoardTests, CanFillEveryCell) {
    RNG rng; rng.seed(3);
    Board board(Params{ 2, 3, 6 }, rng);
    EXPECT_EQ(board.mines().size(), 6u);
}

TEST(BoardTests, NearbyMinesCountsNeighborsOnly) {
    Board board(3, 3, { { 0, 0 }, { 2, 2 } });
    EXPECT_EQ(board.nearbyMines({ 1, 1 }), 2);
    EXPECT_EQ(board.nearbyMines({ 0, 1 }), 1);
    EXPECT_EQ(board.nearbyMines({ 2, 1 }), 1);
    EXPECT_EQ(board.nearbyMines({ 0, 0 }), 0);
    EXPECT_EQ(board.nearbyMines({ 0, 2 }), 0);
}

TEST(BoardTests, RejectsBadLayouts) {
    RNG rng;
    EXPECT_THROW(Board(Params{ 0, 5, 1 }, rng), std::invalid_argument);
    EXPECT_THROW(Board(Params{ 2, 2, 5 }, rng), std::invalid_argument);
    EXPECT_THROW(Board(Params{ 2, 2, -1 }, rng), std::invalid_argument);
    EXPECT_THROW(Board(2, 2, { { 2, 0 } }), std::invalid_argument);
    EXPECT_THROW(Board(Params{ 100000, 100000, 1 }, rng), std::invalid_argument);

    Board board(2, 2, {});
    EXPECT_THROW(board.isMine({ 0, 2 }), std::invalid_argument);
    EXPECT_THROW(board.flag({ -1, 0 }), std::invalid_argument);
}

TEST(BoardTests, WonWhenFlagsMatchMines) {
    Board board(3, 3, { { 0, 0 }, { 2, 2 } });
    EXPECT_FALSE(board.won());

    board.flag({ 0, 0 });
    EXPECT_FALSE(board.won());
    board.flag({ 2, 2 });
    EXPECT_TRUE(board.won());

    board.flag({ 1, 1 });
    EXPECT_FALSE(board.won());
    board.unflag({ 1, 1 });
    EXPECT_TRUE(board.won());

    board.setFlags({});
    EXPECT_FALSE(board.won());
}

TEST(BoardTests, Rendering) {
    Board board(1, 2, { { 0, 1 } });
    EXPECT_EQ(board.toString(), "-----\n| |X|\n-----\n");
}

TEST(BoardTests, CellsHashByCoordinate) {
    std::unordered_set<Cell> cells{ { 1, 2 }, { 2, 1 }, { 1, 2 } };
    EXPECT_EQ(cells.size(), 2u);
    EXPECT_EQ(std::hash<Cell>()({ 4, 5 }), std::hash<Cell>()({ 4, 5 }));
    EXPECT_TRUE(cells.count({ 2, 1 }));
}
