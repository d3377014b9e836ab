#include "MoveValidator.hpp"

bool isValidMove(const Grid& grid, const Position& from, Direction direction) {
    if (!grid.contains(from)) return false;
    if (!grid.contains(offset(from, direction))) return false;
    return !grid.wallsAt(from).hasWall(direction);
}

std::optional<Position> stepFrom(const Grid& grid, const Position& from, Direction direction) {
    if (!isValidMove(grid, from, direction)) return std::nullopt;
    return offset(from, direction);
}
