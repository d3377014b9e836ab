#include "GameState.hpp"
#include "MoveValidator.hpp"
#include "Exceptions.hpp"
#include "Config.hpp"
#include <cmath>
#include <cstdio>
#include <iostream>

void updateTrail(std::vector<Position>& trail, const Position& newPos) {
    if (trail.empty()) return;
    if (trail.back() == newPos) return;

    if (trail.size() >= 2 && trail[trail.size() - 2] == newPos) {
        trail.pop_back();
    } else {
        trail.push_back(newPos);
    }
}

std::string formatTime(double seconds) {
    if (seconds < 0.0) seconds = 0.0;

    // Work in whole tenths so 0.99 shows as 00:00.9. The epsilon absorbs
    // binary representation error (12.3 * 10 = 122.99999...).
    long long tenths = (long long)std::floor(seconds * 10.0 + 1e-6);
    long long minutes = tenths / 600;
    long long secs = (tenths / 10) % 60;
    long long frac = tenths % 10;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%lld", minutes, secs, frac);
    return buf;
}

// ============= GameState Implementation =============

GameState::GameState()
    : currentState(State::MENU)
    , currentDifficulty(Difficulty::EASY)
    , elapsedTime(0.0)
    , moveCount(0)
    , attempts(0)
{
}

void GameState::startGame(Difficulty difficulty) {
    currentDifficulty = difficulty;
    beginWith(Maze::generateMaze(difficulty));
}

void GameState::startGame(Difficulty difficulty, const cv::RNG& rng) {
    currentDifficulty = difficulty;
    beginWith(Maze::generateMaze(difficulty, rng));
}

void GameState::beginWith(Maze generated) {
    maze = std::make_unique<Maze>(std::move(generated));
    playerPosition = maze->start();
    trail.assign(1, playerPosition);
    elapsedTime = 0.0;
    moveCount = 0;
    attempts++;
    currentState = State::PLAYING;
}

void GameState::restart() {
    if (currentState == State::MENU) return;
    startGame(currentDifficulty);
}

void GameState::returnToMenu() {
    maze.reset();
    trail.clear();
    currentState = State::MENU;
}

bool GameState::tryMove(Direction direction) {
    if (currentState != State::PLAYING || !maze) return false;

    auto next = stepFrom(maze->grid(), playerPosition, direction);
    if (!next) return false;

    playerPosition = *next;
    updateTrail(trail, playerPosition);
    moveCount++;

    if (playerPosition == maze->goal()) {
        currentState = State::WON;
        if (Config::runtime.verbose) {
            std::cout << "YOU WIN! Time: " << formatTime(elapsedTime)
                      << " Moves: " << moveCount
                      << " (shortest " << maze->pathLength() << ")\n";
        }
    }
    return true;
}

void GameState::update(double deltaTime) {
    if (currentState == State::PLAYING && deltaTime > 0.0) {
        elapsedTime += deltaTime;
    }
}

const Maze& GameState::getMaze() const {
    require(maze != nullptr, "no maze: game has not been started");
    return *maze;
}
