#pragma once
#include <opencv2/core.hpp>
#include <utility>
#include "Grid.hpp"
#include "Difficulty.hpp"

/**
 * @brief A generated maze: carved grid plus start and goal cells
 *
 * Immutable once generateMaze() returns. Restarting a game means
 * generating a new Maze, never modifying this one.
 */
class Maze {
public:
    /**
     * @brief Generate a maze with a fresh random source
     * @throws ValidationException for an unknown difficulty
     * @throws ProcessingException if placement keeps failing after all retries
     */
    static Maze generateMaze(Difficulty difficulty);

    /**
     * @brief Generate a maze from the given random source (reproducible for a fixed seed)
     */
    static Maze generateMaze(Difficulty difficulty, const cv::RNG& rng);

    /**
     * @brief Generate a maze from explicit settings, tagged with the given difficulty
     *
     * Each generation run that fails placement is discarded and regenerated,
     * up to Config::generation.generationRetries runs.
     * @throws ProcessingException when every run fails placement
     */
    static Maze generateMaze(Difficulty difficulty, const DifficultySettings& settings,
                             const cv::RNG& rng);

    const Grid& grid() const { return m_grid; }
    const Position& start() const { return m_start; }
    const Position& goal() const { return m_goal; }
    Difficulty difficulty() const { return m_difficulty; }
    const DifficultySettings& settings() const { return m_settings; }

    int rows() const { return m_grid.rows(); }
    int cols() const { return m_grid.cols(); }
    std::pair<int, int> dimensions() const { return m_grid.dimensions(); }
    const Cell& wallsAt(const Position& p) const { return m_grid.wallsAt(p); }

    /**
     * @brief Walls removed by the backtracking pass alone
     */
    int carvedWalls() const { return m_carvedWalls; }

    /**
     * @brief Walls removed by the complexity adjustment
     */
    int extraWallsRemoved() const { return m_extraWallsRemoved; }

    /**
     * @brief Shortest-path distance between start and goal
     */
    int pathLength() const { return m_pathLength; }

    /**
     * @brief Largest shortest-path distance from the start
     */
    int startEccentricity() const { return m_startEccentricity; }

    bool isValidMove(const Position& from, Direction direction) const;

private:
    Maze(Difficulty difficulty, const DifficultySettings& settings, Grid grid);

    Difficulty m_difficulty;
    DifficultySettings m_settings;
    Grid m_grid;
    Position m_start;
    Position m_goal;
    int m_carvedWalls;
    int m_extraWallsRemoved;
    int m_pathLength;
    int m_startEccentricity;
};
