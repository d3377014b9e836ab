#pragma once
#include <optional>
#include "Grid.hpp"

/**
 * @brief Check whether a single step is allowed
 * @param grid Carved grid
 * @param from Current cell
 * @param direction Requested step
 * @return false if from or the target is outside the grid, otherwise true
 *         iff the wall of from facing direction is open
 */
bool isValidMove(const Grid& grid, const Position& from, Direction direction);

/**
 * @brief Target cell of a valid step, nullopt if the step is blocked
 */
std::optional<Position> stepFrom(const Grid& grid, const Position& from, Direction direction);
