#include "Menu.hpp"
#include "Config.hpp"
#include "Exceptions.hpp"
#include <algorithm>

namespace {
    constexpr int KEY_ENTER = 13;
    constexpr int KEY_NEWLINE = 10;

    int wrap(int value, int count) {
        return ((value % count) + count) % count;
    }
}

const std::vector<std::string>& MenuModel::shadeNames() {
    static const std::vector<std::string> names = {"Light", "Medium", "Dark"};
    return names;
}

MenuModel::MenuModel()
    : difficulties(getAllDifficulties())
    , selectedIndex(0)
    , breadcrumbs(Config::trail.enabled)
    , shadeIndex(Config::trail.shadeIndex)
{
}

void MenuModel::setSelectedIndex(int index) {
    require(index >= 0 && index < itemCount(), "menu index out of range");
    selectedIndex = index;
}

MenuAction MenuModel::handleKey(int key) {
    switch (key) {
        case 'w': case 'W':
            selectedIndex = wrap(selectedIndex - 1, itemCount());
            break;
        case 's': case 'S':
            selectedIndex = wrap(selectedIndex + 1, itemCount());
            break;
        case KEY_ENTER:
        case KEY_NEWLINE:
            if (selectedIndex < breadcrumbItemIndex()) {
                return MenuAction::START;
            } else if (selectedIndex == breadcrumbItemIndex()) {
                toggleBreadcrumbs();
            } else {
                cycleShade(1);
            }
            break;
        case 'a': case 'A':
            if (selectedIndex == breadcrumbItemIndex()) toggleBreadcrumbs();
            else if (selectedIndex == shadeItemIndex()) cycleShade(-1);
            break;
        case 'd': case 'D':
            if (selectedIndex == breadcrumbItemIndex()) toggleBreadcrumbs();
            else if (selectedIndex == shadeItemIndex()) cycleShade(1);
            break;
        default:
            break;
    }
    return MenuAction::NONE;
}

Difficulty MenuModel::selectedDifficulty() const {
    int idx = std::min(selectedIndex, (int)difficulties.size() - 1);
    return difficulties[idx];
}

void MenuModel::cycleShade(int step) {
    shadeIndex = wrap(shadeIndex + step, (int)shadeNames().size());
}

double MenuModel::trailOpacity() const {
    switch (shadeIndex) {
        case 0:  return Config::trail.lightOpacity;
        case 2:  return Config::trail.darkOpacity;
        default: return Config::trail.mediumOpacity;
    }
}
