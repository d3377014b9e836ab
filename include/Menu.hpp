#pragma once
#include <string>
#include <vector>
#include "Difficulty.hpp"

/**
 * @brief Result of a menu key press
 */
enum class MenuAction {
    NONE,
    START           // Start a game with selectedDifficulty()
};

/**
 * @brief Menu model: difficulty list followed by the trail settings
 *
 * Items: one per difficulty, then "Breadcrumbs", then "Trail Shade".
 */
class MenuModel {
public:
    static const std::vector<std::string>& shadeNames();

    MenuModel();

    /**
     * @brief Handle a key code from cv::waitKey
     */
    MenuAction handleKey(int key);

    int getSelectedIndex() const { return selectedIndex; }
    void setSelectedIndex(int index);
    int itemCount() const { return (int)difficulties.size() + 2; }
    int breadcrumbItemIndex() const { return (int)difficulties.size(); }
    int shadeItemIndex() const { return (int)difficulties.size() + 1; }

    const std::vector<Difficulty>& getDifficulties() const { return difficulties; }

    /**
     * @brief Difficulty under the cursor, clamped when a setting is selected
     */
    Difficulty selectedDifficulty() const;

    bool breadcrumbsEnabled() const { return breadcrumbs; }
    void toggleBreadcrumbs() { breadcrumbs = !breadcrumbs; }

    int getShadeIndex() const { return shadeIndex; }
    void cycleShade(int step);

    /**
     * @brief Overlay alpha for the selected trail shade
     */
    double trailOpacity() const;

private:
    std::vector<Difficulty> difficulties;
    int selectedIndex;
    bool breadcrumbs;
    int shadeIndex;
};
