#include "Renderer.hpp"
#include "Config.hpp"
#include <algorithm>
#include <sstream>

// ============= MazeLayout =============

MazeLayout MazeLayout::fit(const cv::Size& frameSize, int rows, int cols,
                           int paddingPx, int mastheadPx) {
    int availW = frameSize.width - 2 * paddingPx;
    int availH = frameSize.height - mastheadPx - 2 * paddingPx;

    MazeLayout layout;
    layout.cellSize = std::max(1, std::min(availW / std::max(cols, 1), availH / std::max(rows, 1)));

    // Center the grid in the available area
    int gridW = layout.cellSize * cols;
    int gridH = layout.cellSize * rows;
    layout.origin = cv::Point(paddingPx + std::max(0, (availW - gridW) / 2),
                              mastheadPx + paddingPx + std::max(0, (availH - gridH) / 2));
    return layout;
}

cv::Rect MazeLayout::cellRect(const Position& p) const {
    return cv::Rect(origin.x + p.col * cellSize, origin.y + p.row * cellSize, cellSize, cellSize);
}

cv::Point MazeLayout::cellCenter(const Position& p) const {
    return cv::Point(origin.x + p.col * cellSize + cellSize / 2,
                     origin.y + p.row * cellSize + cellSize / 2);
}

// ============= MazeRenderer =============

MazeRenderer::MazeRenderer()
    : backgroundColor(20, 20, 20)
    , wallColor(230, 230, 230)
    , playerColor(0, 215, 255)
    , goalColor(50, 200, 50)
    , startColor(120, 80, 40)
    , trailColor(255, 160, 60)
    , highlightColor(0, 215, 255)
{
}

void MazeRenderer::prepareFrame(cv::Mat& frame) {
    int w = Config::render.windowW;
    int h = Config::render.windowH;
    if (frame.empty() || frame.cols != w || frame.rows != h || frame.type() != CV_8UC3) {
        frame = cv::Mat(h, w, CV_8UC3, backgroundColor);
    } else {
        frame = backgroundColor;
    }
}

void MazeRenderer::drawCentered(cv::Mat& frame, const std::string& text, int y,
                                int font, double scale, const cv::Scalar& color, int thickness) {
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(text, font, scale, thickness, &baseline);
    int textX = (frame.cols - textSize.width) / 2;
    cv::putText(frame, text, cv::Point(textX, y), font, scale, color, thickness, cv::LINE_AA);
}

void MazeRenderer::renderMenu(cv::Mat& frame, const MenuModel& menu) {
    prepareFrame(frame);

    drawCentered(frame, "MAZE GAME", 80, cv::FONT_HERSHEY_DUPLEX, 1.5, cv::Scalar(255, 255, 255), 3);
    drawCentered(frame, "W/S to select, ENTER to start/toggle, A/D to adjust", 130,
                 cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(150, 150, 150), 1);

    int yStart = 200;
    const auto& difficulties = menu.getDifficulties();
    for (int i = 0; i < (int)difficulties.size(); ++i) {
        bool selected = i == menu.getSelectedIndex();
        const DifficultySettings& s = getDifficultySettings(difficulties[i]);

        cv::Scalar color = selected ? highlightColor : cv::Scalar(255, 255, 255);
        std::string label = std::string(selected ? "> " : "  ") + s.name;
        drawCentered(frame, label, yStart + i * 60, cv::FONT_HERSHEY_SIMPLEX, 0.9, color, 2);

        cv::Scalar descColor = selected ? cv::Scalar(200, 200, 200) : cv::Scalar(100, 100, 100);
        drawCentered(frame, s.description, yStart + i * 60 + 25,
                     cv::FONT_HERSHEY_SIMPLEX, 0.5, descColor, 1);
    }

    // Settings section
    int settingsY = yStart + (int)difficulties.size() * 60 + 40;
    drawCentered(frame, "--- Settings ---", settingsY, cv::FONT_HERSHEY_SIMPLEX, 0.5,
                 cv::Scalar(150, 150, 150), 1);

    bool onCrumbs = menu.getSelectedIndex() == menu.breadcrumbItemIndex();
    std::string crumbs = std::string(onCrumbs ? "> " : "  ") + "Breadcrumbs: " +
                         (menu.breadcrumbsEnabled() ? "ON" : "OFF");
    drawCentered(frame, crumbs, settingsY + 50, cv::FONT_HERSHEY_SIMPLEX, 0.9,
                 onCrumbs ? highlightColor : cv::Scalar(255, 255, 255), 2);

    bool onShade = menu.getSelectedIndex() == menu.shadeItemIndex();
    std::string shade = std::string(onShade ? "> " : "  ") + "Trail Shade: " +
                        MenuModel::shadeNames()[menu.getShadeIndex()];
    drawCentered(frame, shade, settingsY + 100, cv::FONT_HERSHEY_SIMPLEX, 0.9,
                 onShade ? highlightColor : cv::Scalar(255, 255, 255), 2);

    drawCentered(frame, "In game: WASD move, B breadcrumbs, R restart, M menu, Q quit",
                 frame.rows - 30, cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(100, 100, 100), 1);
}

void MazeRenderer::render(cv::Mat& frame, const GameState& gameState,
                          bool showTrail, double trailOpacity) {
    prepareFrame(frame);

    const Maze& maze = gameState.getMaze();
    MazeLayout layout = MazeLayout::fit(frame.size(), maze.rows(), maze.cols(),
                                        Config::render.paddingPx, Config::render.mastheadPx);

    renderEndpoints(frame, maze, layout);
    if (showTrail) {
        renderTrail(frame, gameState.getTrail(), layout, trailOpacity);
    }
    renderWalls(frame, maze.grid(), layout);
    renderPlayer(frame, gameState.getPlayerPosition(), layout);
    renderHUD(frame, gameState, showTrail);

    if (gameState.getState() == GameState::State::WON) {
        renderWinScreen(frame, gameState);
    }
}

void MazeRenderer::renderWalls(cv::Mat& frame, const Grid& grid, const MazeLayout& layout) {
    int t = Config::render.wallThicknessPx;

    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            const Cell& cell = grid.wallsAt(Position(r, c));
            cv::Rect rc = layout.cellRect(Position(r, c));
            cv::Point tl(rc.x, rc.y);
            cv::Point tr(rc.x + rc.width, rc.y);
            cv::Point bl(rc.x, rc.y + rc.height);
            cv::Point br(rc.x + rc.width, rc.y + rc.height);

            if (cell.top)    cv::line(frame, tl, tr, wallColor, t, cv::LINE_AA);
            if (cell.right)  cv::line(frame, tr, br, wallColor, t, cv::LINE_AA);
            if (cell.bottom) cv::line(frame, bl, br, wallColor, t, cv::LINE_AA);
            if (cell.left)   cv::line(frame, tl, bl, wallColor, t, cv::LINE_AA);
        }
    }
}

void MazeRenderer::renderEndpoints(cv::Mat& frame, const Maze& maze, const MazeLayout& layout) {
    int inset = std::max(1, layout.cellSize / 6);

    cv::rectangle(frame, layout.cellRect(maze.start()), startColor, -1);

    cv::Rect goal = layout.cellRect(maze.goal());
    goal.x += inset;
    goal.y += inset;
    goal.width -= 2 * inset;
    goal.height -= 2 * inset;
    cv::rectangle(frame, goal, goalColor, -1);
}

void MazeRenderer::renderTrail(cv::Mat& frame, const std::vector<Position>& trail,
                               const MazeLayout& layout, double opacity) {
    if (trail.size() < 2 || opacity <= 0.0) return;

    cv::Mat overlay = frame.clone();
    int thickness = std::max(1, layout.cellSize / 4);
    for (size_t i = 1; i < trail.size(); ++i) {
        cv::line(overlay, layout.cellCenter(trail[i - 1]), layout.cellCenter(trail[i]),
                 trailColor, thickness, cv::LINE_AA);
    }
    cv::addWeighted(overlay, opacity, frame, 1.0 - opacity, 0.0, frame);
}

void MazeRenderer::renderPlayer(cv::Mat& frame, const Position& p, const MazeLayout& layout) {
    int radius = std::max(2, layout.cellSize * 3 / 10);
    cv::circle(frame, layout.cellCenter(p), radius, playerColor, -1, cv::LINE_AA);
}

void MazeRenderer::renderHUD(cv::Mat& frame, const GameState& gameState, bool showTrail) {
    int bandH = std::max(30, Config::render.mastheadPx);
    cv::rectangle(frame, cv::Rect(0, 0, frame.cols, bandH), cv::Scalar(0, 0, 0), -1);
    cv::line(frame, cv::Point(0, bandH), cv::Point(frame.cols, bandH), cv::Scalar(100, 100, 100), 1);

    const Maze& maze = gameState.getMaze();
    std::ostringstream left;
    left << maze.settings().name << " " << maze.rows() << "x" << maze.cols()
         << "  Moves: " << gameState.getMoveCount();
    cv::putText(frame, left.str(), cv::Point(10, bandH / 2 + 6),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);

    std::string timeStr = "Time: " + formatTime(gameState.getElapsedTime());
    int baseline = 0;
    cv::Size ts = cv::getTextSize(timeStr, cv::FONT_HERSHEY_SIMPLEX, 0.6, 1, &baseline);
    cv::putText(frame, timeStr, cv::Point(frame.cols - ts.width - 10, bandH / 2 + 6),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);

    std::string crumbs = showTrail ? "Trail: ON" : "Trail: OFF";
    drawCentered(frame, crumbs, bandH / 2 + 6, cv::FONT_HERSHEY_SIMPLEX, 0.5,
                 cv::Scalar(150, 150, 150), 1);
}

void MazeRenderer::renderWinScreen(cv::Mat& frame, const GameState& gameState) {
    // Semi-transparent overlay
    cv::Mat overlay = frame.clone();
    overlay = cv::Scalar(0, 0, 0);
    cv::addWeighted(overlay, 0.7, frame, 0.3, 0, frame);

    int centerY = frame.rows / 2;
    drawCentered(frame, "YOU WIN!", centerY - 50, cv::FONT_HERSHEY_DUPLEX, 2.0, cv::Scalar(0, 255, 0), 3);

    std::ostringstream stats;
    stats << "Time: " << formatTime(gameState.getElapsedTime())
          << "   Moves: " << gameState.getMoveCount()
          << " (shortest " << gameState.getMaze().pathLength() << ")";
    drawCentered(frame, stats.str(), centerY + 10, cv::FONT_HERSHEY_SIMPLEX, 0.7,
                 cv::Scalar(255, 255, 255), 2);

    drawCentered(frame, "Press R to play again, M for menu", centerY + 60,
                 cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(200, 200, 200), 1);
}
