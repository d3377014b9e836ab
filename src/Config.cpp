/**
 * @file Config.cpp
 * @brief Implementation of centralized configuration management
 */

#include "Config.hpp"
#include "Exceptions.hpp"
#include <opencv2/core.hpp>
#include <iostream>
#include <iomanip>

namespace Config {
    // Define global configuration instances
    Generation generation;
    Render render;
    Trail trail;
    Runtime runtime;

    namespace {
        void validate(const Generation& g, const Render& r, const Trail& t, const Runtime& rt) {
            require(g.placementAttempts >= 1, "generation_placement_attempts must be >= 1");
            require(g.generationRetries >= 1, "generation_retries must be >= 1");
            require(r.windowW > 0 && r.windowH > 0, "render window size must be positive");
            require(r.paddingPx >= 0 && r.mastheadPx >= 0, "render margins must be >= 0");
            require(r.wallThicknessPx >= 1, "render_wall_thickness_px must be >= 1");
            require(t.shadeIndex >= 0 && t.shadeIndex <= 2, "trail_shade_index must be in [0, 2]");
            for (double a : {t.lightOpacity, t.mediumOpacity, t.darkOpacity}) {
                require(a >= 0.0 && a <= 1.0, "trail opacity must be in [0, 1]");
            }
            require(rt.frameDelayMs >= 1, "runtime_frame_delay_ms must be >= 1");
        }
    }

    bool load(const std::string& filename) {
        cv::FileStorage fs;
        try {
            fs.open(filename, cv::FileStorage::READ);
        } catch (const cv::Exception& e) {
            rethrowCv(e, "Cannot parse config file " + filename);
        }

        if (!fs.isOpened()) {
            runtime.sourceConfigPath = filename;
            std::cerr << "Config file not found (" << filename << "), using defaults.\n";
            return false;
        }

        auto get = [&](const char* key, auto& target) {
            if (!fs[key].empty()) fs[key] >> target;
        };
        auto getFlag = [&](const char* key, bool& target) {
            if (!fs[key].empty()) target = (int)fs[key] != 0;
        };

        // Read into copies; the globals change only once everything validates
        Generation g = generation;
        Render r = render;
        Trail t = trail;
        Runtime rt = runtime;

        // Generation parameters
        get("generation_placement_attempts", g.placementAttempts);
        get("generation_retries", g.generationRetries);

        // Render parameters
        get("render_window_w", r.windowW);
        get("render_window_h", r.windowH);
        get("render_padding_px", r.paddingPx);
        get("render_masthead_px", r.mastheadPx);
        get("render_wall_thickness_px", r.wallThicknessPx);

        // Trail parameters
        getFlag("trail_enabled", t.enabled);
        get("trail_shade_index", t.shadeIndex);
        get("trail_light_opacity", t.lightOpacity);
        get("trail_medium_opacity", t.mediumOpacity);
        get("trail_dark_opacity", t.darkOpacity);

        // Runtime parameters
        getFlag("runtime_verbose", rt.verbose);
        get("runtime_frame_delay_ms", rt.frameDelayMs);

        validate(g, r, t, rt);

        rt.sourceConfigPath = filename;
        generation = g;
        render = r;
        trail = t;
        runtime = rt;

        if (runtime.verbose) {
            std::cout << "Loaded configuration from: " << filename << "\n";
        }
        return true;
    }

    void reset() {
        generation = Generation();
        render = Render();
        trail = Trail();
        runtime = Runtime();
    }

    void printSummary() {
        std::cout << "\n=== CONFIG SUMMARY ===\n";
        std::cout << "Config path: " << runtime.sourceConfigPath << "\n";
        std::cout << "Generation: placementAttempts=" << generation.placementAttempts
                  << " retries=" << generation.generationRetries << "\n";
        std::cout << "Render: window=" << render.windowW << "x" << render.windowH
                  << " padding=" << render.paddingPx
                  << " masthead=" << render.mastheadPx
                  << " wallThickness=" << render.wallThicknessPx << "\n";
        std::ios::fmtflags flags = std::cout.flags();
        std::streamsize precision = std::cout.precision();
        std::cout << std::fixed << std::setprecision(2)
                  << "Trail: enabled=" << (trail.enabled ? "true" : "false")
                  << " shade=" << trail.shadeIndex
                  << " opacity=" << trail.lightOpacity << "/" << trail.mediumOpacity
                  << "/" << trail.darkOpacity << "\n";
        std::cout.flags(flags);
        std::cout.precision(precision);
        std::cout << "Runtime: verbose=" << (runtime.verbose ? "true" : "false")
                  << " frameDelayMs=" << runtime.frameDelayMs << "\n";
        std::cout << "=======================\n\n";
    }

} // namespace Config
