#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <vector>
#include "Grid.hpp"
#include "Difficulty.hpp"

/**
 * @brief Chosen start and goal cells
 */
struct Placement {
    Position start;
    Position goal;
    int distance;       // BFS distance start -> goal
    int eccentricity;   // Largest BFS distance from start
};

/**
 * @brief Breadth-first distances over open passages
 * @param grid Carved grid
 * @param from Source cell
 * @return Row-major distances, -1 for unreachable cells
 */
std::vector<int> bfsDistances(const Grid& grid, const Position& from);

/**
 * @brief Largest finite value in a distance table
 */
int eccentricity(const std::vector<int>& distances);

/**
 * @brief True if every cell is reachable from (0,0)
 */
bool isFullyConnected(const Grid& grid);

/**
 * @brief One shortest route between two cells
 * @return Directions to follow (empty if from == to), nullopt if unreachable
 */
std::optional<std::vector<Direction>> shortestPath(const Grid& grid,
                                                   const Position& from,
                                                   const Position& to);

/**
 * @brief Required start->goal distance for a candidate with the given eccentricity
 * @return ceil(eccentricity * minPathFraction), at least 1
 */
int requiredDistance(int eccentricity, double minPathFraction);

/**
 * @brief Pick a start cell at random and the farthest reachable cell as goal
 * @param grid Carved grid with at least 2 cells
 * @param settings Difficulty preset (for minPathFraction)
 * @param rng Random source for candidate starts
 * @param attempts Number of candidate starts to try
 * @throws ValidationException if the grid has fewer than 2 cells or attempts < 1
 * @throws ProcessingException if no candidate satisfies the distance constraint
 */
Placement placeStartAndGoal(const Grid& grid,
                            const DifficultySettings& settings,
                            cv::RNG& rng,
                            int attempts);
