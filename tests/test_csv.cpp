#include <gtest/gtest.h>

#include "io/Csv.hpp"

#include <filesystem>
#include <fstream>

using namespace ms;

namespace {

    PlayedGame sampleGame() {
        GameResult res;
        res.won = true; res.moves = 4; res.guesses = 1; res.flagged = 2;
        return PlayedGame{ Board(2, 3, { { 0, 1 }, { 1, 2 } }), res };
    }

    std::string tempPath(const std::string& name) {
        return (std::filesystem::temp_directory_path() / name).string();
    }

}

TEST(CsvTests, EncodeWritesLayoutRowByRow) {
    auto row = CsvIO::encode(7, sampleGame());
    EXPECT_EQ(row.index, 7);
    EXPECT_EQ(row.height, 2);
    EXPECT_EQ(row.width, 3);
    EXPECT_EQ(row.mines, 2);
    EXPECT_EQ(row.map, "010#001");
    EXPECT_TRUE(row.won);
    EXPECT_FALSE(row.lost);
    EXPECT_EQ(row.moves, 4);
    EXPECT_EQ(row.guesses, 1);
    EXPECT_EQ(row.flagged, 2);
}

TEST(CsvTests, DecodeRebuildsBoard) {
    auto g = CsvIO::decode(CsvIO::encode(0, sampleGame()));
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->board.mines(), (CellSet{ { 0, 1 }, { 1, 2 } }));
    EXPECT_EQ(g->board.height(), 2);
    EXPECT_EQ(g->board.width(), 3);
    EXPECT_TRUE(g->result.won);
    EXPECT_EQ(g->result.moves, 4);
}

TEST(CsvTests, DecodeRejectsMalformedLayouts) {
    auto row = CsvIO::encode(0, sampleGame());

    auto badRows = row; badRows.map = "010";
    EXPECT_FALSE(CsvIO::decode(badRows).has_value());

    auto badWidth = row; badWidth.map = "0100#001";
    EXPECT_FALSE(CsvIO::decode(badWidth).has_value());

    auto badChar = row; badChar.map = "0x0#001";
    EXPECT_FALSE(CsvIO::decode(badChar).has_value());

    auto badCount = row; badCount.mines = 3;
    EXPECT_FALSE(CsvIO::decode(badCount).has_value());

    auto badSize = row; badSize.height = 0;
    EXPECT_FALSE(CsvIO::decode(badSize).has_value());
}

TEST(CsvTests, SaveAppendsAfterSingleHeader) {
    const auto path = tempPath("minesweeper_csv_save_test.csv");
    std::filesystem::remove(path);

    auto row = CsvIO::encode(0, sampleGame());
    ASSERT_TRUE(CsvIO::save(path, { row }, false));
    row.index = 1;
    ASSERT_TRUE(CsvIO::save(path, { row, row }, true));

    auto rows = CsvIO::load(path);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].index, 0);
    EXPECT_EQ(rows[2].index, 1);
    EXPECT_EQ(rows[1].map, "010#001");

    std::ifstream f(path);
    std::string header; std::getline(f, header);
    EXPECT_EQ(header, "index,height,width,mines,map,won,lost,moves,guesses,flagged");

    std::filesystem::remove(path);
}

TEST(CsvTests, LoadSkipsBrokenLines) {
    const auto path = tempPath("minesweeper_csv_broken_test.csv");
    {
        std::ofstream f(path, std::ios::trunc);
        f << "index,height,width,mines,map,won,lost,moves,guesses,flagged\n";
        f << "0,2,3,2,010#001,1,0,4,1,2\n";
        f << "\n";
        f << "short,line\n";
        f << "2,2,3,2,010#001,1,4,1,2\n";
        f << "x,2,3,2,010#001,1,0,4,1,2\n";
        f << "1,1,1,0,0,0,0,1,1,0\n";
    }
    auto rows = CsvIO::load(path);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].index, 0);
    EXPECT_EQ(rows[1].index, 1);
    EXPECT_FALSE(rows[1].won);
    EXPECT_FALSE(rows[1].lost);

    std::filesystem::remove(path);
}

TEST(CsvTests, StalledAndLostGamesStayDistinct) {
    auto lost = sampleGame();
    lost.result.won = false; lost.result.lost = true;
    auto stalled = sampleGame();
    stalled.result.won = false;

    const auto path = tempPath("minesweeper_csv_outcome_test.csv");
    ASSERT_TRUE(CsvIO::save(path, { CsvIO::encode(0, lost), CsvIO::encode(1, stalled) }, false));
    auto rows = CsvIO::load(path);
    ASSERT_EQ(rows.size(), 2u);

    auto a = CsvIO::decode(rows[0]);
    auto b = CsvIO::decode(rows[1]);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(a->result.lost);
    EXPECT_FALSE(b->result.lost);
    EXPECT_STREQ(outcomeLabel(a->result), "Lost");
    EXPECT_STREQ(outcomeLabel(b->result), "Stalled");
    EXPECT_STREQ(outcomeLabel(sampleGame().result), "Won");

    std::filesystem::remove(path);
}

TEST(CsvTests, LoadMissingFileIsEmpty) {
    EXPECT_TRUE(CsvIO::load(tempPath("minesweeper_csv_does_not_exist.csv")).empty());
}
