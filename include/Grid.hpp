#pragma once
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Cell coordinate inside a grid
 */
struct Position {
    int row;
    int col;

    Position() : row(0), col(0) {}
    Position(int r, int c) : row(r), col(c) {}

    bool operator==(const Position& o) const { return row == o.row && col == o.col; }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

/**
 * @brief Movement / wall direction
 */
enum class Direction {
    UP,
    RIGHT,
    DOWN,
    LEFT
};

/**
 * @brief All directions in clockwise order starting at UP
 */
const std::array<Direction, 4>& allDirections();

/**
 * @brief Direction facing the other way
 */
Direction opposite(Direction d);

/**
 * @brief Position one step from p in direction d (may be out of bounds)
 */
Position offset(const Position& p, Direction d);

/**
 * @brief Lowercase name ("up", "right", "down", "left")
 */
std::string directionName(Direction d);

/**
 * @brief Parse a direction name, nullopt for anything unknown
 */
std::optional<Direction> parseDirection(const std::string& name);

/**
 * @brief Wall flags of a single cell
 */
struct Cell {
    bool top;
    bool right;
    bool bottom;
    bool left;

    Cell() : top(true), right(true), bottom(true), left(true) {}

    bool hasWall(Direction d) const;
    void clearWall(Direction d);
    bool isClosed() const { return top && right && bottom && left; }
};

/**
 * @brief Rectangular grid of cells, stored row-major
 *
 * Walls between neighbours are always kept consistent: removeWall() clears
 * both facing flags at once and nothing ever puts a wall back.
 */
class Grid {
public:
    /**
     * @brief Create a fully walled grid
     * @throws ValidationException if rows or cols is not positive
     */
    static Grid createGrid(int rows, int cols);

    int rows() const { return nRows; }
    int cols() const { return nCols; }
    std::pair<int, int> dimensions() const { return {nRows, nCols}; }
    int cellCount() const { return nRows * nCols; }

    bool contains(const Position& p) const;

    /**
     * @brief Wall flags of the cell at p
     * @throws ValidationException if p is out of bounds
     */
    const Cell& wallsAt(const Position& p) const;

    bool hasWall(const Position& p, Direction d) const { return wallsAt(p).hasWall(d); }

    /**
     * @brief In-bounds neighbours of p with the direction of the shared wall
     */
    std::vector<std::pair<Position, Direction>> neighborsOf(const Position& p) const;

    /**
     * @brief Clear the wall between two adjacent cells on both sides
     * @throws ValidationException if a or b is out of bounds or they are not adjacent
     */
    void removeWall(const Position& a, const Position& b);

    /**
     * @brief Number of interior walls that have been removed
     */
    int openPassageCount() const;

    int index(const Position& p) const { return p.row * nCols + p.col; }
    Position positionOf(int idx) const { return Position(idx / nCols, idx % nCols); }

private:
    Grid(int rows, int cols);

    Cell& cellAt(const Position& p);

    int nRows;
    int nCols;
    std::vector<Cell> cells;
};
