#include <gtest/gtest.h>
#include "Menu.hpp"
#include "Config.hpp"
#include "Exceptions.hpp"

class MenuTest : public ::testing::Test {
protected:
    void SetUp() override { Config::reset(); }
    void TearDown() override { Config::reset(); }
};

TEST_F(MenuTest, Defaults) {
    MenuModel menu;
    EXPECT_EQ(menu.getSelectedIndex(), 0);
    EXPECT_EQ(menu.selectedDifficulty(), Difficulty::EASY);
    EXPECT_TRUE(menu.breadcrumbsEnabled());
    EXPECT_EQ(menu.getShadeIndex(), 1);
    EXPECT_EQ(MenuModel::shadeNames()[menu.getShadeIndex()], "Medium");
    EXPECT_EQ(menu.itemCount(), (int)getAllDifficulties().size() + 2);
}

TEST_F(MenuTest, DefaultsFollowConfig) {
    Config::trail.enabled = false;
    Config::trail.shadeIndex = 2;
    MenuModel menu;
    EXPECT_FALSE(menu.breadcrumbsEnabled());
    EXPECT_EQ(menu.getShadeIndex(), 2);
}

TEST_F(MenuTest, NavigationWrapsAround) {
    MenuModel menu;
    menu.handleKey('w');
    EXPECT_EQ(menu.getSelectedIndex(), menu.itemCount() - 1);
    menu.handleKey('s');
    EXPECT_EQ(menu.getSelectedIndex(), 0);

    for (int i = 0; i < 3; ++i) menu.handleKey('s');
    EXPECT_EQ(menu.selectedDifficulty(), Difficulty::VERY_HARD);
}

TEST_F(MenuTest, EnterOnDifficultyStartsGame) {
    MenuModel menu;
    menu.handleKey('s');
    EXPECT_EQ(menu.handleKey(13), MenuAction::START);
    EXPECT_EQ(menu.selectedDifficulty(), Difficulty::MEDIUM);
}

TEST_F(MenuTest, SettingsItemsClampSelectedDifficulty) {
    MenuModel menu;
    menu.setSelectedIndex(menu.shadeItemIndex());
    EXPECT_EQ(menu.selectedDifficulty(), Difficulty::VERY_HARD);
    EXPECT_THROW(menu.setSelectedIndex(menu.itemCount()), ValidationException);
}

TEST_F(MenuTest, EnterTogglesBreadcrumbsAndCyclesShade) {
    MenuModel menu;
    menu.setSelectedIndex(menu.breadcrumbItemIndex());
    EXPECT_EQ(menu.handleKey(13), MenuAction::NONE);
    EXPECT_FALSE(menu.breadcrumbsEnabled());
    menu.handleKey('d');
    EXPECT_TRUE(menu.breadcrumbsEnabled());

    menu.setSelectedIndex(menu.shadeItemIndex());
    menu.handleKey(13);
    EXPECT_EQ(menu.getShadeIndex(), 2);
    menu.handleKey(13);
    EXPECT_EQ(menu.getShadeIndex(), 0);
    menu.handleKey('a');
    EXPECT_EQ(menu.getShadeIndex(), 2);
}

TEST_F(MenuTest, LeftRightOnDifficultyDoNothing) {
    MenuModel menu;
    menu.handleKey('a');
    menu.handleKey('d');
    EXPECT_EQ(menu.getSelectedIndex(), 0);
    EXPECT_TRUE(menu.breadcrumbsEnabled());
    EXPECT_EQ(menu.getShadeIndex(), 1);
}

TEST_F(MenuTest, TrailOpacityFollowsShade) {
    MenuModel menu;
    menu.setSelectedIndex(menu.shadeItemIndex());

    EXPECT_DOUBLE_EQ(menu.trailOpacity(), Config::trail.mediumOpacity);
    menu.cycleShade(1);
    EXPECT_DOUBLE_EQ(menu.trailOpacity(), Config::trail.darkOpacity);
    menu.cycleShade(1);
    EXPECT_DOUBLE_EQ(menu.trailOpacity(), Config::trail.lightOpacity);
}
