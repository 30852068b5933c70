#pragma once

#include <raylib.h>

namespace ember::constants {
inline constexpr int window_width = 1280;
inline constexpr int window_height = 720;
inline constexpr int target_fps = 60;

inline constexpr ::Color background{18, 18, 24, 255};

// Distance a pointer must travel from its down position before a tap turns into a drag.
inline constexpr float drag_slop_px = 6.0F;
inline constexpr float zoom_per_scroll_unit = 0.1F;
inline constexpr float min_zoom = 0.1F;
inline constexpr float max_zoom = 8.0F;

inline constexpr float debug_line_width = 1.0F;
inline constexpr ::Color debug_color{0, 255, 120, 200};
inline constexpr float grid_spacing = 100.0F;
inline constexpr float grid_min_screen_px = 40.0F;
inline constexpr ::Color grid_color{40, 40, 48, 255};
inline constexpr ::Color axis_color{80, 80, 96, 255};

inline constexpr float square_size = 100.0F;

inline constexpr float fixed_dt_min = 1e-4F;
inline constexpr float fixed_dt_max = 0.1F;
inline constexpr float time_scale_min = 0.0F;
inline constexpr float time_scale_max = 4.0F;

// Default configuration values (used to initialize Config)
inline constexpr float default_fixed_dt = 1.0F / target_fps;  // seconds
inline constexpr float default_time_scale = 1.0F;
}  // namespace ember::constants
