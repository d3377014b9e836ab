#pragma once
#include <string>
#include <vector>

/**
 * @brief Difficulty presets
 */
enum class Difficulty {
    EASY,           // 10x10, many loops
    MEDIUM,         // 20x20
    HARD,           // 30x30
    VERY_HARD       // 40x40, perfect maze
};

/**
 * @brief Parameters attached to a difficulty preset
 */
struct DifficultySettings {
    int rows;
    int cols;
    double wallRemovalProbability;  // Chance to open each remaining interior wall after carving
    double minPathFraction;         // Required start->goal distance as a fraction of eccentricity
    const char* name;
    const char* description;
};

/**
 * @brief Look up the preset table
 * @throws ValidationException for values outside the enum
 */
const DifficultySettings& getDifficultySettings(Difficulty difficulty);

/**
 * @brief Display name of a difficulty ("Easy", "Very Hard", ...)
 */
std::string getDifficultyName(Difficulty difficulty);

/**
 * @brief All presets, easiest first
 */
std::vector<Difficulty> getAllDifficulties();

/**
 * @brief Parse "easy" / "medium" / "hard" / "very_hard" (case-insensitive)
 * @throws ValidationException for unknown keys
 */
Difficulty parseDifficulty(const std::string& key);
