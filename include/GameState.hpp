#pragma once
#include <memory>
#include <string>
#include <vector>
#include "Maze.hpp"

/**
 * @brief Update the breadcrumb trail after the player moved to newPos
 *
 * Stepping back onto the previous trail cell pops the current one,
 * any other new cell is appended. Same cell or empty trail: no change.
 */
void updateTrail(std::vector<Position>& trail, const Position& newPos);

/**
 * @brief Format seconds as "MM:SS.t" (tenths truncated)
 */
std::string formatTime(double seconds);

/**
 * @brief Game state management
 */
class GameState {
public:
    enum class State {
        MENU,           // Difficulty selection
        PLAYING,        // Active gameplay
        WON             // Player reached the goal
    };

    GameState();

    /**
     * @brief Generate a new maze and place the player on its start cell
     */
    void startGame(Difficulty difficulty);

    /**
     * @brief Same as startGame() but with an explicit random source
     */
    void startGame(Difficulty difficulty, const cv::RNG& rng);

    /**
     * @brief New maze at the current difficulty (from PLAYING or WON)
     */
    void restart();

    /**
     * @brief Drop the current maze and go back to the menu
     */
    void returnToMenu();

    /**
     * @brief Move the player one cell if the maze allows it
     * @return true if the player moved
     */
    bool tryMove(Direction direction);

    /**
     * @brief Advance the timer (only while playing)
     */
    void update(double deltaTime);

    State getState() const { return currentState; }
    Difficulty getDifficulty() const { return currentDifficulty; }
    bool hasMaze() const { return maze != nullptr; }

    /**
     * @brief Current maze
     * @throws ValidationException when no game has been started
     */
    const Maze& getMaze() const;

    const Position& getPlayerPosition() const { return playerPosition; }
    const std::vector<Position>& getTrail() const { return trail; }
    double getElapsedTime() const { return elapsedTime; }
    int getMoveCount() const { return moveCount; }
    int getAttempts() const { return attempts; }

private:
    void beginWith(Maze generated);

    State currentState;
    Difficulty currentDifficulty;
    std::unique_ptr<Maze> maze;
    Position playerPosition;
    std::vector<Position> trail;
    double elapsedTime;
    int moveCount;
    int attempts;
};
