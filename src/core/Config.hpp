// src/core/Config.hpp
#pragma once

#include <raylib-cpp.hpp>

#include "Constants.hpp"

namespace ember {

// Global engine configuration stored in flecs as a singleton component.
struct Config {
    // Time
    bool paused = false;
    bool use_fixed_dt = false;
    float fixed_dt = constants::default_fixed_dt;
    float time_scale = constants::default_time_scale;

    // Input
    float drag_slop_px = constants::drag_slop_px;  // device pixels before a press becomes a drag
    float zoom_per_scroll_unit = constants::zoom_per_scroll_unit;

    // Visuals
    bool debug_mode = false;  // outlines + world grid
    bool show_inspector = true;
    raylib::Color background{constants::background};

    // UI/runtime
    double last_update_ms = 0.0;
};

}  // namespace ember
