#include <gtest/gtest.h>

#include "core/Sentence.hpp"

using namespace ms;

namespace {
    const Cell A{ 0, 0 };
    const Cell B{ 0, 1 };
    const Cell C{ 1, 1 };
    const Cell D{ 2, 2 };
}

TEST(SentenceTests, AllCellsAreMinesWhenCountEqualsSize) {
    Sentence s({ A, B }, 2);
    EXPECT_EQ(s.knownMines(), (CellSet{ A, B }));
    EXPECT_TRUE(s.knownSafes().empty());
}

TEST(SentenceTests, AllCellsAreSafeWhenCountIsZero) {
    Sentence s({ A, B, C }, 0);
    EXPECT_EQ(s.knownSafes(), (CellSet{ A, B, C }));
    EXPECT_TRUE(s.knownMines().empty());
}

TEST(SentenceTests, NothingKnownInBetween) {
    Sentence s({ A, B, C }, 1);
    EXPECT_TRUE(s.knownMines().empty());
    EXPECT_TRUE(s.knownSafes().empty());
}

TEST(SentenceTests, KnownSetsAreCopies) {
    Sentence s({ A, B }, 2);
    auto mines = s.knownMines();
    s.markMine(A);

    EXPECT_EQ(mines.size(), 2u);
    EXPECT_EQ(s.cells(), (CellSet{ B }));
    EXPECT_EQ(s.count(), 1);
}

TEST(SentenceTests, MarkMineRemovesCellAndDecrementsCount) {
    Sentence s({ A, B, C }, 2);
    s.markMine(B);
    EXPECT_EQ(s.cells(), (CellSet{ A, C }));
    EXPECT_EQ(s.count(), 1);
}

TEST(SentenceTests, MarkSafeRemovesCellAndKeepsCount) {
    Sentence s({ A, B, C }, 1);
    s.markSafe(A);
    EXPECT_EQ(s.cells(), (CellSet{ B, C }));
    EXPECT_EQ(s.count(), 1);
}

TEST(SentenceTests, MarkingAbsentCellChangesNothing) {
    Sentence s({ A, B }, 1);
    s.markSafe(D);
    s.markMine(D);
    EXPECT_EQ(s, Sentence({ A, B }, 1));

    s.markMine(D);
    s.markSafe(D);
    EXPECT_EQ(s, Sentence({ A, B }, 1));
}

TEST(SentenceTests, RejectsImpossibleCounts) {
    EXPECT_THROW(Sentence({ A }, 2), ContradictionError);
    EXPECT_THROW(Sentence({ A, B }, -1), ContradictionError);
    EXPECT_THROW(Sentence({}, 1), ContradictionError);
    EXPECT_NO_THROW(Sentence({}, 0));
}

TEST(SentenceTests, MarkMineWithNoMinesLeftThrows) {
    Sentence s({ A, B }, 0);
    EXPECT_THROW(s.markMine(A), ContradictionError);
}

TEST(SentenceTests, MarkSafeOnAllMineSentenceThrows) {
    Sentence s({ A, B }, 2);
    EXPECT_THROW(s.markSafe(B), ContradictionError);
}

TEST(SentenceTests, EqualityIsByValue) {
    EXPECT_EQ(Sentence({ A, B }, 1), Sentence({ B, A }, 1));
    EXPECT_NE(Sentence({ A, B }, 1), Sentence({ A, B }, 2));
    EXPECT_NE(Sentence({ A, B }, 1), Sentence({ A, C }, 1));
}

TEST(SentenceTests, Rendering) {
    EXPECT_EQ(Sentence({ B, A }, 1).toString(), "{(0,0), (0,1)} = 1");
    EXPECT_EQ(Sentence({}, 0).toString(), "{} = 0");
}
