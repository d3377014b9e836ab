#include "Maze.hpp"
#include "MazeGenerator.hpp"
#include "MoveValidator.hpp"
#include "Placement.hpp"
#include "Exceptions.hpp"
#include "Config.hpp"
#include <iostream>

Maze::Maze(Difficulty difficulty, const DifficultySettings& settings, Grid grid)
    : m_difficulty(difficulty)
    , m_settings(settings)
    , m_grid(std::move(grid))
    , m_carvedWalls(0)
    , m_extraWallsRemoved(0)
    , m_pathLength(0)
    , m_startEccentricity(0)
{
}

Maze Maze::generateMaze(Difficulty difficulty) {
    return generateMaze(difficulty, cv::RNG(MazeGenerator::randomSeed()));
}

Maze Maze::generateMaze(Difficulty difficulty, const cv::RNG& rng) {
    return generateMaze(difficulty, getDifficultySettings(difficulty), rng);
}

Maze Maze::generateMaze(Difficulty difficulty, const DifficultySettings& settings,
                        const cv::RNG& rng) {
    require(settings.rows * settings.cols >= 2, "maze needs at least 2 cells");

    MazeGenerator generator(rng);
    std::string lastError;

    for (int run = 0; run < Config::generation.generationRetries; ++run) {
        GenerationResult result = generator.generate(settings);

        try {
            Placement placement = placeStartAndGoal(result.grid, settings, generator.rng(),
                                                    Config::generation.placementAttempts);

            Maze maze(difficulty, settings, std::move(result.grid));
            maze.m_start = placement.start;
            maze.m_goal = placement.goal;
            maze.m_carvedWalls = result.carvedWalls;
            maze.m_extraWallsRemoved = result.extraWallsRemoved;
            maze.m_pathLength = placement.distance;
            maze.m_startEccentricity = placement.eccentricity;

            if (Config::runtime.verbose) {
                std::cout << "✓ Generated " << settings.name << " maze "
                          << settings.rows << "x" << settings.cols
                          << " | carved=" << result.carvedWalls
                          << " extra=" << result.extraWallsRemoved
                          << " | start=(" << placement.start.row << "," << placement.start.col << ")"
                          << " goal=(" << placement.goal.row << "," << placement.goal.col << ")"
                          << " distance=" << placement.distance << "\n";
            }
            return maze;
        } catch (const ProcessingException& e) {
            lastError = e.what();
            std::cerr << "✗ Generation run " << (run + 1) << " failed placement: " << lastError << "\n";
        }
    }

    throw ProcessingException("cannot place start/goal for " + std::string(settings.name) +
                              " maze after " + std::to_string(Config::generation.generationRetries) +
                              " generations (" + lastError + ")");
}

bool Maze::isValidMove(const Position& from, Direction direction) const {
    return ::isValidMove(m_grid, from, direction);
}
