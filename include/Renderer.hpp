#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include "GameState.hpp"
#include "Menu.hpp"

/**
 * @brief Pixel placement of a grid inside a frame
 */
struct MazeLayout {
    cv::Point origin;   // Top-left corner of cell (0,0)
    int cellSize;       // Square cell edge in pixels

    /**
     * @brief Fit a rows x cols grid below the masthead with the given padding
     */
    static MazeLayout fit(const cv::Size& frameSize, int rows, int cols,
                          int paddingPx, int mastheadPx);

    cv::Rect cellRect(const Position& p) const;
    cv::Point cellCenter(const Position& p) const;
};

/**
 * @brief Top-down renderer for the maze game using OpenCV drawing
 */
class MazeRenderer {
public:
    MazeRenderer();

    /**
     * @brief Render the menu screen
     * @param frame Output frame (allocated to the configured window size if needed)
     * @param menu Menu model to display
     */
    void renderMenu(cv::Mat& frame, const MenuModel& menu);

    /**
     * @brief Render the complete game scene (maze, trail, player, HUD, win overlay)
     * @param frame Output frame
     * @param gameState Current game state, must hold a maze
     * @param showTrail Draw the breadcrumb trail
     * @param trailOpacity Overlay alpha of the trail
     */
    void render(cv::Mat& frame, const GameState& gameState,
                bool showTrail, double trailOpacity);

    /**
     * @brief Render walls of the grid
     */
    void renderWalls(cv::Mat& frame, const Grid& grid, const MazeLayout& layout);

    /**
     * @brief Render start and goal markers
     */
    void renderEndpoints(cv::Mat& frame, const Maze& maze, const MazeLayout& layout);

    /**
     * @brief Render breadcrumb trail as a translucent band through cell centers
     */
    void renderTrail(cv::Mat& frame, const std::vector<Position>& trail,
                     const MazeLayout& layout, double opacity);

    /**
     * @brief Render the player
     */
    void renderPlayer(cv::Mat& frame, const Position& p, const MazeLayout& layout);

    /**
     * @brief Render game HUD (difficulty, time, moves)
     */
    void renderHUD(cv::Mat& frame, const GameState& gameState, bool showTrail);

    /**
     * @brief Render win screen overlay
     */
    void renderWinScreen(cv::Mat& frame, const GameState& gameState);

    // Configuration
    void setPlayerColor(const cv::Scalar& color) { playerColor = color; }

private:
    void prepareFrame(cv::Mat& frame);
    void drawCentered(cv::Mat& frame, const std::string& text, int y,
                      int font, double scale, const cv::Scalar& color, int thickness);

    cv::Scalar backgroundColor;
    cv::Scalar wallColor;
    cv::Scalar playerColor;
    cv::Scalar goalColor;
    cv::Scalar startColor;
    cv::Scalar trailColor;
    cv::Scalar highlightColor;
};
