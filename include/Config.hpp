/**
 * @file Config.hpp
 * @brief Centralized configuration management for the maze game
 */

#pragma once

#include <string>

namespace Config {
    /**
     * @brief Maze generation parameters
     * @details Dimensions are fixed per difficulty and are not configurable here.
     */
    struct Generation {
        int placementAttempts = 8;
        int generationRetries = 5;
    };

    /**
     * @brief Rendering configuration parameters
     */
    struct Render {
        int windowW = 800;
        int windowH = 800;
        int paddingPx = 20;
        int mastheadPx = 60;
        int wallThicknessPx = 2;
    };

    /**
     * @brief Breadcrumb trail defaults
     */
    struct Trail {
        bool enabled = true;
        int shadeIndex = 1;
        double lightOpacity = 0.25;
        double mediumOpacity = 0.45;
        double darkOpacity = 0.7;
    };

    /**
     * @brief Runtime behavior configuration
     */
    struct Runtime {
        bool verbose = true;
        int frameDelayMs = 16;
        std::string sourceConfigPath;
    };

    // Global configuration instances
    extern Generation generation;
    extern Render render;
    extern Trail trail;
    extern Runtime runtime;

    /**
     * @brief Load configuration from YAML file
     * @param filename Path to configuration file
     * @return true if loaded, false if the file does not exist (defaults kept)
     * @throws ProcessingException if the file cannot be parsed
     * @throws ValidationException if a value is out of range (current values are kept)
     */
    bool load(const std::string& filename);

    /**
     * @brief Restore every section to its default values
     */
    void reset();

    /**
     * @brief Print configuration summary to console
     */
    void printSummary();

} // namespace Config
