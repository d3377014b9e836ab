#include "Utils.hpp"
#include "Config.hpp"
#include <cstdlib>
#include <iostream>
#include <vector>

std::filesystem::path resolveDataRoot(const std::filesystem::path& exePath) {
    // Check environment variable first
    if (const char* env = std::getenv("MAZE_DATA_DIR")) {
        std::filesystem::path p(env);
        std::error_code ec;
        if (std::filesystem::is_directory(p, ec)) {
            if (Config::runtime.verbose) std::cout << "Using MAZE_DATA_DIR: " << p << "\n";
            return std::filesystem::canonical(p, ec);
        }
        std::cerr << "MAZE_DATA_DIR is not a directory: " << p << "\n";
    }

    std::error_code ec;
    std::filesystem::path exeDir = std::filesystem::canonical(exePath, ec).parent_path();
    if (ec) {
        exeDir = exePath.parent_path();
        if (exeDir.empty()) {
            exeDir = std::filesystem::current_path();
        }
    }

    // Common locations relative to executable (ordered by priority)
    std::vector<std::filesystem::path> candidates = {
        exeDir / "data",                              // build/data (copied by cmake)
        exeDir / ".." / "data",                       // source tree when running from build/
        std::filesystem::current_path() / "data"
    };

    for (auto& c : candidates) {
        std::filesystem::path normalized = std::filesystem::weakly_canonical(c, ec);
        if (!ec && std::filesystem::is_directory(normalized, ec)) {
            if (Config::runtime.verbose) std::cout << "Found data at: " << normalized << "\n";
            return normalized;
        }
    }

    std::filesystem::path fallback = std::filesystem::current_path() / "data";
    std::cerr << "Data directory not found, using: " << fallback << "\n";
    return fallback;
}
