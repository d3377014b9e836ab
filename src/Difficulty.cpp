#include "Difficulty.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace {
    const std::array<DifficultySettings, 4> kPresets = {{
        {10, 10, 0.30, 0.6, "Easy",      "10x10 maze, simple paths"},
        {20, 20, 0.15, 0.6, "Medium",    "20x20 maze, moderate complexity"},
        {30, 30, 0.05, 0.6, "Hard",      "30x30 maze, complex paths"},
        {40, 40, 0.00, 0.6, "Very Hard", "40x40 maze, maximum complexity"},
    }};
}

const DifficultySettings& getDifficultySettings(Difficulty difficulty) {
    int idx = static_cast<int>(difficulty);
    require(idx >= 0 && idx < (int)kPresets.size(),
            "unknown difficulty value " + std::to_string(idx));
    return kPresets[idx];
}

std::string getDifficultyName(Difficulty difficulty) {
    return getDifficultySettings(difficulty).name;
}

std::vector<Difficulty> getAllDifficulties() {
    return {
        Difficulty::EASY,
        Difficulty::MEDIUM,
        Difficulty::HARD,
        Difficulty::VERY_HARD
    };
}

Difficulty parseDifficulty(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    if (k == "easy") return Difficulty::EASY;
    if (k == "medium") return Difficulty::MEDIUM;
    if (k == "hard") return Difficulty::HARD;
    if (k == "very_hard" || k == "very hard") return Difficulty::VERY_HARD;

    throw ValidationException("unknown difficulty key '" + key + "'");
}
