#include "MazeGenerator.hpp"
#include "Exceptions.hpp"
#include <random>
#include <stack>
#include <vector>

MazeGenerator::MazeGenerator()
    : m_rng(randomSeed())
{
}

MazeGenerator::MazeGenerator(uint64 seed)
    : m_rng(seed)
{
}

MazeGenerator::MazeGenerator(const cv::RNG& rng)
    : m_rng(rng)
{
}

uint64 MazeGenerator::randomSeed() {
    std::random_device rd;
    uint64 hi = rd();
    uint64 lo = rd();
    return (hi << 32) | lo;
}

int MazeGenerator::carve(Grid& grid) {
    Position start(m_rng.uniform(0, grid.rows()), m_rng.uniform(0, grid.cols()));
    return carve(grid, start);
}

// Depth-first walk with an explicit stack:
//   - mark the start visited and push it
//   - while the stack is not empty, look at the top cell
//       - if it has unvisited neighbours, open the wall to a random one,
//         mark it visited and push it
//       - otherwise pop (backtrack)
int MazeGenerator::carve(Grid& grid, const Position& startCell) {
    require(grid.contains(startCell), "carve start cell is outside the grid");

    std::vector<char> visited(grid.cellCount(), 0);
    std::stack<Position> path;
    int removed = 0;

    visited[grid.index(startCell)] = 1;
    path.push(startCell);

    std::vector<Position> candidates;
    candidates.reserve(4);

    while (!path.empty()) {
        Position current = path.top();

        candidates.clear();
        for (const auto& n : grid.neighborsOf(current)) {
            if (!visited[grid.index(n.first)]) {
                candidates.push_back(n.first);
            }
        }

        if (candidates.empty()) {
            path.pop();
            continue;
        }

        Position next = candidates[m_rng.uniform(0, (int)candidates.size())];
        grid.removeWall(current, next);
        removed++;

        visited[grid.index(next)] = 1;
        path.push(next);
    }

    return removed;
}

int MazeGenerator::adjustComplexity(Grid& grid, double probability) {
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw ValidationException("wall removal probability must be in [0, 1], got " +
                                  std::to_string(probability));
    }

    if (probability <= 0.0) return 0;

    int removed = 0;
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            Position p(r, c);
            const Cell& cell = grid.wallsAt(p);

            // Each interior wall is owned by its left/top cell
            if (c + 1 < grid.cols() && cell.right &&
                m_rng.uniform(0.0, 1.0) < probability) {
                grid.removeWall(p, Position(r, c + 1));
                removed++;
            }
            if (r + 1 < grid.rows() && grid.wallsAt(p).bottom &&
                m_rng.uniform(0.0, 1.0) < probability) {
                grid.removeWall(p, Position(r + 1, c));
                removed++;
            }
        }
    }
    return removed;
}

GenerationResult MazeGenerator::generate(const DifficultySettings& settings) {
    Grid grid = Grid::createGrid(settings.rows, settings.cols);
    int carved = carve(grid);
    int extra = adjustComplexity(grid, settings.wallRemovalProbability);
    return GenerationResult{std::move(grid), carved, extra};
}
