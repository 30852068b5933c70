#pragma once

#include <algorithm>
#include <cmath>
#include <raylib-cpp.hpp>

#include "../components/Component.hpp"
#include "../components/ComponentSet.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"

namespace ember {

class Renderer {
public:
    // Draws the tree under the camera, front to back in priority order. Expects to be called
    // between BeginDrawing() and EndDrawing().
    static void render_scene(const ComponentSet& root, const Config& cfg, const raylib::Camera2D& cam) {
        ClearBackground(cfg.background);
        BeginMode2D(cam);
        if (cfg.debug_mode) draw_debug_grid(cam);
        root.for_each([&](const Component& c) { c.render_tree(cfg.debug_mode); });
        EndMode2D();
    }

    // World-space spacing of the debug grid: the base spacing doubled or halved until lines are
    // between grid_min_screen_px and twice that apart on screen.
    static float grid_spacing(const float zoom) {
        float spacing = constants::grid_spacing;
        if (zoom <= 0.0F) return spacing;
        while (spacing * zoom < constants::grid_min_screen_px) spacing *= 2.0F;
        while (spacing * zoom >= 2.0F * constants::grid_min_screen_px) spacing *= 0.5F;
        return spacing;
    }

private:
    static void draw_debug_grid(const raylib::Camera2D& cam) {
        const float spacing = grid_spacing(cam.zoom);
        const float w = static_cast<float>(GetScreenWidth());
        const float h = static_cast<float>(GetScreenHeight());

        // The camera may be rotated, so bound all four corners.
        raylib::Vector2 lo{GetScreenToWorld2D(::Vector2{0.0F, 0.0F}, cam)};
        raylib::Vector2 hi = lo;
        for (const ::Vector2 corner : {::Vector2{w, 0.0F}, ::Vector2{0.0F, h}, ::Vector2{w, h}}) {
            const ::Vector2 p = GetScreenToWorld2D(corner, cam);
            lo = raylib::Vector2{std::min(lo.x, p.x), std::min(lo.y, p.y)};
            hi = raylib::Vector2{std::max(hi.x, p.x), std::max(hi.y, p.y)};
        }

        const int first_col = static_cast<int>(std::floor(lo.x / spacing));
        const int last_col = static_cast<int>(std::ceil(hi.x / spacing));
        const int first_row = static_cast<int>(std::floor(lo.y / spacing));
        const int last_row = static_cast<int>(std::ceil(hi.y / spacing));
        for (int col = first_col; col <= last_col; ++col) {
            const float x = static_cast<float>(col) * spacing;
            DrawLineV(::Vector2{x, lo.y}, ::Vector2{x, hi.y}, col == 0 ? constants::axis_color : constants::grid_color);
        }
        for (int row = first_row; row <= last_row; ++row) {
            const float y = static_cast<float>(row) * spacing;
            DrawLineV(::Vector2{lo.x, y}, ::Vector2{hi.x, y}, row == 0 ? constants::axis_color : constants::grid_color);
        }
    }
};

}  // namespace ember
