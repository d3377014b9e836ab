#include "Placement.hpp"
#include "MoveValidator.hpp"
#include "Exceptions.hpp"
#include "Config.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <queue>

std::vector<int> bfsDistances(const Grid& grid, const Position& from) {
    require(grid.contains(from), "BFS source is outside the grid");

    std::vector<int> dist(grid.cellCount(), -1);
    std::queue<Position> frontier;

    dist[grid.index(from)] = 0;
    frontier.push(from);

    while (!frontier.empty()) {
        Position p = frontier.front();
        frontier.pop();
        int d = dist[grid.index(p)];

        for (Direction dir : allDirections()) {
            if (!isValidMove(grid, p, dir)) continue;
            Position n = offset(p, dir);
            int& nd = dist[grid.index(n)];
            if (nd < 0) {
                nd = d + 1;
                frontier.push(n);
            }
        }
    }
    return dist;
}

int eccentricity(const std::vector<int>& distances) {
    int best = 0;
    for (int d : distances) {
        best = std::max(best, d);
    }
    return best;
}

bool isFullyConnected(const Grid& grid) {
    std::vector<int> dist = bfsDistances(grid, Position(0, 0));
    return std::none_of(dist.begin(), dist.end(), [](int d) { return d < 0; });
}

std::optional<std::vector<Direction>> shortestPath(const Grid& grid,
                                                   const Position& from,
                                                   const Position& to) {
    require(grid.contains(from) && grid.contains(to), "path endpoints must lie inside the grid");

    // BFS from the target, then walk downhill from the source
    std::vector<int> dist = bfsDistances(grid, to);
    int remaining = dist[grid.index(from)];
    if (remaining < 0) return std::nullopt;

    std::vector<Direction> route;
    route.reserve(remaining);

    Position p = from;
    while (remaining > 0) {
        bool stepped = false;
        for (Direction dir : allDirections()) {
            if (!isValidMove(grid, p, dir)) continue;
            Position n = offset(p, dir);
            if (dist[grid.index(n)] == remaining - 1) {
                route.push_back(dir);
                p = n;
                remaining--;
                stepped = true;
                break;
            }
        }
        if (!stepped) {
            throw ProcessingException("inconsistent BFS distances while tracing path");
        }
    }
    return route;
}

int requiredDistance(int eccentricity, double minPathFraction) {
    int needed = (int)std::ceil(eccentricity * minPathFraction);
    return std::max(needed, 1);
}

Placement placeStartAndGoal(const Grid& grid,
                            const DifficultySettings& settings,
                            cv::RNG& rng,
                            int attempts) {
    require(grid.cellCount() >= 2, "start/goal placement needs at least 2 cells");
    require(attempts >= 1, "placement attempts must be >= 1");

    for (int attempt = 0; attempt < attempts; ++attempt) {
        Position start(rng.uniform(0, grid.rows()), rng.uniform(0, grid.cols()));
        std::vector<int> dist = bfsDistances(grid, start);

        // Farthest reachable cell, first in row-major order on ties
        int farIdx = grid.index(start);
        for (int i = 0; i < (int)dist.size(); ++i) {
            if (dist[i] > dist[farIdx]) farIdx = i;
        }

        int ecc = dist[farIdx];
        int needed = requiredDistance(ecc, settings.minPathFraction);
        Position goal = grid.positionOf(farIdx);

        if (goal != start && ecc >= needed) {
            return Placement{start, goal, ecc, ecc};
        }

        if (Config::runtime.verbose) {
            std::cout << "✗ Placement attempt " << (attempt + 1) << "/" << attempts
                      << " rejected (eccentricity " << ecc << ", need " << needed << ")\n";
        }
    }

    throw ProcessingException("no start/goal pair meets the minimum distance after " +
                              std::to_string(attempts) + " attempts");
}
