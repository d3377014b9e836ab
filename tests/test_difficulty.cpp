#include <gtest/gtest.h>
#include "Difficulty.hpp"
#include "Exceptions.hpp"

TEST(DifficultyTest, PresetTable) {
    const DifficultySettings& easy = getDifficultySettings(Difficulty::EASY);
    EXPECT_EQ(easy.rows, 10);
    EXPECT_EQ(easy.cols, 10);
    EXPECT_DOUBLE_EQ(easy.wallRemovalProbability, 0.30);

    EXPECT_EQ(getDifficultySettings(Difficulty::MEDIUM).rows, 20);
    EXPECT_EQ(getDifficultySettings(Difficulty::HARD).rows, 30);

    const DifficultySettings& veryHard = getDifficultySettings(Difficulty::VERY_HARD);
    EXPECT_EQ(veryHard.rows, 40);
    EXPECT_EQ(veryHard.cols, 40);
    EXPECT_DOUBLE_EQ(veryHard.wallRemovalProbability, 0.0);

    for (Difficulty d : getAllDifficulties()) {
        EXPECT_DOUBLE_EQ(getDifficultySettings(d).minPathFraction, 0.6);
    }
}

TEST(DifficultyTest, HarderMeansLargerAndFewerLoops) {
    auto all = getAllDifficulties();
    ASSERT_EQ(all.size(), 4u);
    for (size_t i = 1; i < all.size(); ++i) {
        const auto& prev = getDifficultySettings(all[i - 1]);
        const auto& cur = getDifficultySettings(all[i]);
        EXPECT_LT(prev.rows, cur.rows);
        EXPECT_LT(prev.cols, cur.cols);
        EXPECT_GT(prev.wallRemovalProbability, cur.wallRemovalProbability);
    }
}

TEST(DifficultyTest, NamesAndParsing) {
    EXPECT_EQ(getDifficultyName(Difficulty::EASY), "Easy");
    EXPECT_EQ(getDifficultyName(Difficulty::VERY_HARD), "Very Hard");

    EXPECT_EQ(parseDifficulty("easy"), Difficulty::EASY);
    EXPECT_EQ(parseDifficulty("MEDIUM"), Difficulty::MEDIUM);
    EXPECT_EQ(parseDifficulty("Hard"), Difficulty::HARD);
    EXPECT_EQ(parseDifficulty("very_hard"), Difficulty::VERY_HARD);
}

TEST(DifficultyTest, UnknownKeysAreRejected) {
    EXPECT_THROW(parseDifficulty("impossible"), ValidationException);
    EXPECT_THROW(parseDifficulty(""), ValidationException);
    EXPECT_THROW(getDifficultySettings(static_cast<Difficulty>(7)), ValidationException);
}
