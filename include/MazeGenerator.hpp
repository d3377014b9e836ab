#pragma once
#include <opencv2/core.hpp>
#include "Grid.hpp"
#include "Difficulty.hpp"

/**
 * @brief Output of one generation run
 */
struct GenerationResult {
    Grid grid;
    int carvedWalls;        // Walls removed by the backtracking pass (rows*cols - 1)
    int extraWallsRemoved;  // Walls removed by the complexity adjustment
};

/**
 * @brief Recursive-backtracking maze generator
 *
 * Each generator owns its own random source, so independent generators
 * never share random state. Seed it explicitly for reproducible mazes.
 */
class MazeGenerator {
public:
    /**
     * @brief Generator seeded from std::random_device
     */
    MazeGenerator();

    /**
     * @brief Generator with a fixed seed
     */
    explicit MazeGenerator(uint64 seed);

    /**
     * @brief Generator continuing from an existing random source
     */
    explicit MazeGenerator(const cv::RNG& rng);

    /**
     * @brief Carve a perfect maze starting at a random cell
     * @return Number of walls removed (always rows*cols - 1)
     */
    int carve(Grid& grid);

    /**
     * @brief Carve a perfect maze starting at the given cell
     * @param grid Fully walled grid
     * @param startCell First cell of the depth-first walk
     * @return Number of walls removed
     */
    int carve(Grid& grid, const Position& startCell);

    /**
     * @brief Open remaining interior walls at random to create loops
     * @param grid Carved grid
     * @param probability Chance to open each still-walled adjacent pair, in [0, 1]
     * @return Number of walls removed
     */
    int adjustComplexity(Grid& grid, double probability);

    /**
     * @brief Create, carve and adjust a grid for the given preset
     */
    GenerationResult generate(const DifficultySettings& settings);

    /**
     * @brief Random source, shared with start/goal placement for the same maze
     */
    cv::RNG& rng() { return m_rng; }

    /**
     * @brief Seed value drawn from std::random_device
     */
    static uint64 randomSeed();

private:
    cv::RNG m_rng;
};
