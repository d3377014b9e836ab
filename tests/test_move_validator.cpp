#include <gtest/gtest.h>
#include <array>
#include <utility>
#include "MoveValidator.hpp"
#include "MazeGenerator.hpp"

TEST(MoveValidatorTest, OutwardMovesFromBoundaryCellsAreRejected) {
    // Open every interior wall so only the border can block
    Grid grid = Grid::createGrid(4, 5);
    MazeGenerator generator(3u);
    generator.carve(grid);
    generator.adjustComplexity(grid, 1.0);

    EXPECT_FALSE(isValidMove(grid, Position(0, 0), Direction::UP));
    EXPECT_FALSE(isValidMove(grid, Position(0, 0), Direction::LEFT));

    for (int c = 0; c < grid.cols(); ++c) {
        EXPECT_FALSE(isValidMove(grid, Position(0, c), Direction::UP));
        EXPECT_FALSE(isValidMove(grid, Position(grid.rows() - 1, c), Direction::DOWN));
    }
    for (int r = 0; r < grid.rows(); ++r) {
        EXPECT_FALSE(isValidMove(grid, Position(r, 0), Direction::LEFT));
        EXPECT_FALSE(isValidMove(grid, Position(r, grid.cols() - 1), Direction::RIGHT));
    }
}

TEST(MoveValidatorTest, PositionsOutsideGridAreRejected) {
    Grid grid = Grid::createGrid(2, 2);
    grid.removeWall(Position(0, 0), Position(0, 1));
    EXPECT_FALSE(isValidMove(grid, Position(-1, 0), Direction::DOWN));
    EXPECT_FALSE(isValidMove(grid, Position(0, 2), Direction::LEFT));
    EXPECT_FALSE(isValidMove(grid, Position(5, 5), Direction::UP));
}

TEST(MoveValidatorTest, ManualTwoByTwoScenario) {
    Grid grid = Grid::createGrid(2, 2);
    grid.removeWall(Position(0, 0), Position(0, 1));

    EXPECT_TRUE(isValidMove(grid, Position(0, 0), Direction::RIGHT));
    EXPECT_FALSE(isValidMove(grid, Position(0, 0), Direction::DOWN));
    EXPECT_TRUE(isValidMove(grid, Position(0, 1), Direction::LEFT));
    EXPECT_FALSE(isValidMove(grid, Position(0, 1), Direction::DOWN));
}

TEST(MoveValidatorTest, ValidIffWallOpenForEveryTwoByTwoLayout) {
    const std::array<std::pair<Position, Position>, 4> interior = {{
        {Position(0, 0), Position(0, 1)},
        {Position(0, 0), Position(1, 0)},
        {Position(0, 1), Position(1, 1)},
        {Position(1, 0), Position(1, 1)},
    }};

    for (int mask = 0; mask < 16; ++mask) {
        Grid grid = Grid::createGrid(2, 2);
        for (int i = 0; i < 4; ++i) {
            if (mask & (1 << i)) grid.removeWall(interior[i].first, interior[i].second);
        }

        for (int r = 0; r < 2; ++r) {
            for (int c = 0; c < 2; ++c) {
                Position p(r, c);
                for (Direction d : allDirections()) {
                    bool inside = grid.contains(offset(p, d));
                    bool open = !grid.wallsAt(p).hasWall(d);
                    EXPECT_EQ(isValidMove(grid, p, d), inside && open)
                        << "mask=" << mask << " cell=(" << r << "," << c << ") dir=" << directionName(d);
                }
            }
        }
    }
}

TEST(MoveValidatorTest, StepFromReturnsTargetOnlyWhenOpen) {
    Grid grid = Grid::createGrid(2, 2);
    grid.removeWall(Position(0, 0), Position(1, 0));

    auto down = stepFrom(grid, Position(0, 0), Direction::DOWN);
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(*down, Position(1, 0));

    EXPECT_FALSE(stepFrom(grid, Position(0, 0), Direction::RIGHT).has_value());
    EXPECT_FALSE(stepFrom(grid, Position(0, 0), Direction::UP).has_value());
}
