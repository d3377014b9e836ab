#pragma once
#include <filesystem>

/**
 * @brief Resolves the data root directory
 * @details Checks MAZE_DATA_DIR first, then "data" next to / above the executable
 *          and in the working directory.
 */
std::filesystem::path resolveDataRoot(const std::filesystem::path& exePath);
