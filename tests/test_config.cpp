#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "Config.hpp"
#include "Exceptions.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::reset();
        dir = std::filesystem::temp_directory_path() / "gridmaze_config_test";
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        Config::reset();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::string writeText(const std::string& name, const std::string& text) {
        std::filesystem::path p = dir / name;
        std::ofstream out(p);
        out << text;
        return p.string();
    }

    std::filesystem::path dir;
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    EXPECT_FALSE(Config::load((dir / "does_not_exist.yaml").string()));
    EXPECT_EQ(Config::generation.placementAttempts, 8);
    EXPECT_EQ(Config::generation.generationRetries, 5);
    EXPECT_TRUE(Config::trail.enabled);
}

TEST_F(ConfigTest, WrittenValuesOverrideDefaults) {
    std::string path = (dir / "custom.yaml").string();
    {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        fs << "generation_placement_attempts" << 3;
        fs << "generation_retries" << 2;
        fs << "render_window_w" << 640;
        fs << "trail_enabled" << 0;
        fs << "trail_shade_index" << 2;
        fs << "trail_dark_opacity" << 0.9;
        fs << "runtime_verbose" << 0;
    }

    EXPECT_TRUE(Config::load(path));
    EXPECT_EQ(Config::generation.placementAttempts, 3);
    EXPECT_EQ(Config::generation.generationRetries, 2);
    EXPECT_EQ(Config::render.windowW, 640);
    EXPECT_EQ(Config::render.windowH, 800);
    EXPECT_FALSE(Config::trail.enabled);
    EXPECT_EQ(Config::trail.shadeIndex, 2);
    EXPECT_DOUBLE_EQ(Config::trail.darkOpacity, 0.9);
    EXPECT_FALSE(Config::runtime.verbose);
    EXPECT_EQ(Config::runtime.sourceConfigPath, path);
}

TEST_F(ConfigTest, OutOfRangeValuesAreRejected) {
    std::string path = writeText("bad_shade.yaml",
                                 "%YAML:1.0\n---\ntrail_shade_index: 5\n");
    EXPECT_THROW(Config::load(path), ValidationException);

    path = writeText("bad_retries.yaml",
                     "%YAML:1.0\n---\ngeneration_retries: 0\n");
    EXPECT_THROW(Config::load(path), ValidationException);
}

TEST_F(ConfigTest, RejectedFileLeavesEveryValueUntouched) {
    std::string path = writeText("mixed.yaml",
                                 "%YAML:1.0\n---\n"
                                 "generation_placement_attempts: 2\n"
                                 "generation_retries: 9\n"
                                 "render_window_w: 320\n"
                                 "render_wall_thickness_px: 4\n"
                                 "trail_enabled: 0\n"
                                 "trail_shade_index: 5\n"
                                 "trail_light_opacity: 0.1\n"
                                 "runtime_verbose: 0\n"
                                 "runtime_frame_delay_ms: 40\n");
    EXPECT_THROW(Config::load(path), ValidationException);

    const Config::Generation g{};
    const Config::Render r{};
    const Config::Trail t{};
    const Config::Runtime rt{};
    EXPECT_EQ(Config::generation.placementAttempts, g.placementAttempts);
    EXPECT_EQ(Config::generation.generationRetries, g.generationRetries);
    EXPECT_EQ(Config::render.windowW, r.windowW);
    EXPECT_EQ(Config::render.windowH, r.windowH);
    EXPECT_EQ(Config::render.wallThicknessPx, r.wallThicknessPx);
    EXPECT_EQ(Config::trail.enabled, t.enabled);
    EXPECT_EQ(Config::trail.shadeIndex, t.shadeIndex);
    EXPECT_DOUBLE_EQ(Config::trail.lightOpacity, t.lightOpacity);
    EXPECT_EQ(Config::runtime.verbose, rt.verbose);
    EXPECT_EQ(Config::runtime.frameDelayMs, rt.frameDelayMs);
    EXPECT_EQ(Config::runtime.sourceConfigPath, rt.sourceConfigPath);
}

TEST_F(ConfigTest, SummaryRestoresStreamFormatting) {
    std::ios::fmtflags flags = std::cout.flags();
    std::streamsize precision = std::cout.precision();

    Config::printSummary();

    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
}

TEST_F(ConfigTest, MalformedFileIsProcessingError) {
    std::string path = writeText("broken.yaml",
                                 "%YAML:1.0\n---\nrender_window_w: \"unterminated\n");
    EXPECT_THROW(Config::load(path), ProcessingException);
}

TEST_F(ConfigTest, ResetRestoresDefaults) {
    Config::generation.placementAttempts = 1;
    Config::runtime.verbose = false;
    Config::reset();
    EXPECT_EQ(Config::generation.placementAttempts, 8);
    EXPECT_TRUE(Config::runtime.verbose);
}
