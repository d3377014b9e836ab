#include "Grid.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace {
    std::string describe(const Position& p) {
        std::ostringstream ss;
        ss << "(" << p.row << "," << p.col << ")";
        return ss.str();
    }
}

const std::array<Direction, 4>& allDirections() {
    static const std::array<Direction, 4> dirs = {
        Direction::UP, Direction::RIGHT, Direction::DOWN, Direction::LEFT
    };
    return dirs;
}

Direction opposite(Direction d) {
    switch (d) {
        case Direction::UP:    return Direction::DOWN;
        case Direction::RIGHT: return Direction::LEFT;
        case Direction::DOWN:  return Direction::UP;
        case Direction::LEFT:  return Direction::RIGHT;
    }
    throw ValidationException("unknown direction");
}

Position offset(const Position& p, Direction d) {
    switch (d) {
        case Direction::UP:    return Position(p.row - 1, p.col);
        case Direction::RIGHT: return Position(p.row, p.col + 1);
        case Direction::DOWN:  return Position(p.row + 1, p.col);
        case Direction::LEFT:  return Position(p.row, p.col - 1);
    }
    throw ValidationException("unknown direction");
}

std::string directionName(Direction d) {
    switch (d) {
        case Direction::UP:    return "up";
        case Direction::RIGHT: return "right";
        case Direction::DOWN:  return "down";
        case Direction::LEFT:  return "left";
    }
    return "unknown";
}

std::optional<Direction> parseDirection(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    for (Direction d : allDirections()) {
        if (directionName(d) == key) return d;
    }
    return std::nullopt;
}

// ============= Cell =============

bool Cell::hasWall(Direction d) const {
    switch (d) {
        case Direction::UP:    return top;
        case Direction::RIGHT: return right;
        case Direction::DOWN:  return bottom;
        case Direction::LEFT:  return left;
    }
    return true;
}

void Cell::clearWall(Direction d) {
    switch (d) {
        case Direction::UP:    top = false; break;
        case Direction::RIGHT: right = false; break;
        case Direction::DOWN:  bottom = false; break;
        case Direction::LEFT:  left = false; break;
    }
}

// ============= Grid =============

Grid::Grid(int rows, int cols)
    : nRows(rows)
    , nCols(cols)
    , cells(static_cast<size_t>(rows) * static_cast<size_t>(cols))
{
}

Grid Grid::createGrid(int rows, int cols) {
    require(rows > 0 && cols > 0,
            "grid dimensions must be positive, got " + std::to_string(rows) + "x" + std::to_string(cols));
    return Grid(rows, cols);
}

bool Grid::contains(const Position& p) const {
    return p.row >= 0 && p.row < nRows && p.col >= 0 && p.col < nCols;
}

const Cell& Grid::wallsAt(const Position& p) const {
    if (!contains(p)) {
        throw ValidationException("position " + describe(p) + " is outside the grid");
    }
    return cells[index(p)];
}

Cell& Grid::cellAt(const Position& p) {
    if (!contains(p)) {
        throw ValidationException("position " + describe(p) + " is outside the grid");
    }
    return cells[index(p)];
}

std::vector<std::pair<Position, Direction>> Grid::neighborsOf(const Position& p) const {
    if (!contains(p)) {
        throw ValidationException("position " + describe(p) + " is outside the grid");
    }

    std::vector<std::pair<Position, Direction>> result;
    result.reserve(4);
    for (Direction d : allDirections()) {
        Position n = offset(p, d);
        if (contains(n)) {
            result.emplace_back(n, d);
        }
    }
    return result;
}

void Grid::removeWall(const Position& a, const Position& b) {
    if (!contains(a) || !contains(b)) {
        throw ValidationException("cannot remove wall between " + describe(a) + " and " +
                                  describe(b) + ": out of bounds");
    }

    int dr = b.row - a.row;
    int dc = b.col - a.col;
    if (std::abs(dr) + std::abs(dc) != 1) {
        throw ValidationException("cannot remove wall between " + describe(a) + " and " +
                                  describe(b) + ": not adjacent");
    }

    Direction d;
    if (dr == -1)      d = Direction::UP;
    else if (dr == 1)  d = Direction::DOWN;
    else if (dc == 1)  d = Direction::RIGHT;
    else               d = Direction::LEFT;

    cellAt(a).clearWall(d);
    cellAt(b).clearWall(opposite(d));
}

int Grid::openPassageCount() const {
    int open = 0;
    for (int r = 0; r < nRows; ++r) {
        for (int c = 0; c < nCols; ++c) {
            const Cell& cell = cells[r * nCols + c];
            // Count each shared wall once, from its left/top cell
            if (c + 1 < nCols && !cell.right) open++;
            if (r + 1 < nRows && !cell.bottom) open++;
        }
    }
    return open;
}
