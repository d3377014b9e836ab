/**
 * @file main.cpp
 * @brief Grid Maze Game - Main Application
 *
 * Pick a difficulty, then walk the player from the start cell to the goal
 * cell one step at a time. Walls block movement.
 *
 * Usage: ./GridMaze [--config FILE]
 */

#include <opencv2/opencv.hpp>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <algorithm>

#include "Config.hpp"
#include "Exceptions.hpp"
#include "GameState.hpp"
#include "Menu.hpp"
#include "Renderer.hpp"
#include "Utils.hpp"

const std::string WINDOW_NAME = "Grid Maze";

class GridMazeGame {
public:
    GridMazeGame()
        : running(true)
        , showTrail(Config::trail.enabled)
        , lastTime(std::chrono::steady_clock::now())
    {
    }

    void initialize() {
        cv::namedWindow(WINDOW_NAME, cv::WINDOW_AUTOSIZE);
    }

    void run() {
        cv::Mat frame;

        while (running) {
            updateDeltaTime();

            if (gameState.getState() == GameState::State::MENU) {
                renderer.renderMenu(frame, menu);
            } else {
                renderer.render(frame, gameState, showTrail, menu.trailOpacity());
            }

            cv::imshow(WINDOW_NAME, frame);

            int key = cv::waitKey(Config::runtime.frameDelayMs);
            handleKey(key);
        }

        cv::destroyWindow(WINDOW_NAME);
    }

private:
    void handleKey(int key) {
        if (key < 0) return;
        key &= 0xFF;

        if (key == 'q' || key == 'Q') {
            running = false;
            return;
        }

        switch (gameState.getState()) {
            case GameState::State::MENU:
                handleMenuKey(key);
                break;
            case GameState::State::PLAYING:
            case GameState::State::WON:
                handleGameKey(key);
                break;
        }
    }

    void handleMenuKey(int key) {
        if (key == 27) {  // ESC
            running = false;
            return;
        }

        if (menu.handleKey(key) == MenuAction::START) {
            showTrail = menu.breadcrumbsEnabled();
            Difficulty difficulty = menu.selectedDifficulty();
            std::cout << "Starting game: " << getDifficultyName(difficulty) << "\n";
            gameState.startGame(difficulty);
        }
    }

    void handleGameKey(int key) {
        switch (key) {
            case 'w': case 'W': gameState.tryMove(Direction::UP); break;
            case 'd': case 'D': gameState.tryMove(Direction::RIGHT); break;
            case 's': case 'S': gameState.tryMove(Direction::DOWN); break;
            case 'a': case 'A': gameState.tryMove(Direction::LEFT); break;
            case 'r': case 'R':
                std::cout << "Restarting: " << getDifficultyName(gameState.getDifficulty()) << "\n";
                gameState.restart();
                break;
            case 'b': case 'B':
                showTrail = !showTrail;
                break;
            case 'm': case 'M':
            case 27:  // ESC
                gameState.returnToMenu();
                break;
            default:
                break;
        }
    }

    void updateDeltaTime() {
        auto now = std::chrono::steady_clock::now();
        double deltaTime = std::chrono::duration<double>(now - lastTime).count();
        lastTime = now;

        // Clamp delta time
        gameState.update(std::min(deltaTime, 0.1));
    }

    bool running;
    bool showTrail;
    std::chrono::steady_clock::time_point lastTime;

    MenuModel menu;
    GameState gameState;
    MazeRenderer renderer;
};

int main(int argc, char** argv) {
    try {
        std::cout << "========================================\n";
        std::cout << "            GRID MAZE GAME\n";
        std::cout << "========================================\n\n";

        std::string configFile;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --config FILE   Game configuration (default: <data>/config.yaml)\n"
                          << "  --help          Show this help\n";
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << " (see --help)\n";
                return 1;
            }
        }

        if (configFile.empty()) {
            std::filesystem::path dataRoot = resolveDataRoot(std::filesystem::path(argv[0]));
            configFile = (dataRoot / "config.yaml").string();
        }

        Config::load(configFile);
        Config::printSummary();

        GridMazeGame game;
        game.initialize();
        game.run();

        std::cout << "\nGame ended. Goodbye!\n";
        return 0;
    } catch (const MazeException& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 2;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 4;
    }
}
