#pragma once

#include <imgui.h>
#include <raylib-cpp.hpp>
#include <rlImGui.h>
#include <string>

#include "../components/Component.hpp"
#include "../components/PositionComponent.hpp"
#include "../components/mixins/Draggable.hpp"
#include "../components/mixins/Hoverable.hpp"
#include "../components/mixins/Tappable.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"
#include "../game/Game.hpp"
#include "Input.hpp"

namespace ember {

// Debug inspector drawn with Dear ImGui on top of the game.
class UI {
public:
    static void setup() { rlImGuiSetup(true); }
    static void shutdown() { rlImGuiShutdown(); }
    static void begin() { rlImGuiBegin(); }
    static void end() { rlImGuiEnd(); }

    static bool wants_mouse() {
        const ImGuiIO& io = ImGui::GetIO();
        return io.WantCaptureMouse &&
            (ImGui::IsWindowHovered(ImGuiHoveredFlags_AnyWindow) || ImGui::IsAnyItemHovered());
    }

    static void draw(Game& game, const GestureRecognizer& gestures) {
        Config& cfg = game.config();
        if (!cfg.show_inspector) return;
        draw_engine_panel(game, cfg, gestures);
        draw_tree_panel(game);
    }

private:
    static void draw_engine_panel(Game& game, Config& cfg, const GestureRecognizer& gestures) {
        ImGui::SetNextWindowPos(ImVec2(12, 12), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(320, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Engine");
        ImGui::Checkbox("Paused", &cfg.paused);
        ImGui::SameLine();
        ImGui::Checkbox("Debug", &cfg.debug_mode);
        ImGui::Checkbox("Use Fixed dt", &cfg.use_fixed_dt);
        ImGui::SliderFloat("Fixed dt", &cfg.fixed_dt, constants::fixed_dt_min, constants::fixed_dt_max, "%.4f");
        ImGui::SliderFloat("Time Scale", &cfg.time_scale, constants::time_scale_min, constants::time_scale_max,
                           "%.2f");
        ImGui::SliderFloat("Drag Slop (px)", &cfg.drag_slop_px, 0.0F, 32.0F, "%.1f");
        raylib::Camera2D& cam = game.camera();
        ImGui::SliderFloat("Zoom", &cam.zoom, constants::min_zoom, constants::max_zoom, "%.2f");
        ImGui::Text("Target: (%.1f, %.1f)", cam.target.x, cam.target.y);
        ImGui::Text("Live gestures: %d", static_cast<int>(gestures.active_gestures()));
        ImGui::Text("Last update: %.3f ms", cfg.last_update_ms);
        ImGui::End();
    }

    static void draw_tree_panel(Game& game) {
        ImGui::SetNextWindowPos(ImVec2(12, 260), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(320, 360), ImGuiCond_FirstUseEver);
        ImGui::Begin("Components");
        ImGui::Text("Top-level: %d", static_cast<int>(game.components().size()));
        // Front-most first, matching input order.
        game.components().for_each_reversed([](Component& c) { draw_node(c); });
        ImGui::End();
    }

    static void draw_node(Component& c) {
        std::string label{c.debug_label()};
        label += " [p=" + std::to_string(c.priority()) + "]";
        if (const auto* d = c.query<Draggable>(); d && d->is_dragged()) {
            label += " drag x" + std::to_string(d->drag_pointers().size());
        }
        if (const auto* t = c.query<Tappable>(); t && t->is_pressed()) label += " pressed";
        if (const auto* h = c.query<Hoverable>(); h && h->is_hovered()) label += " hovered";

        ImGui::PushID(&c);
        const ImGuiTreeNodeFlags flags = c.children().empty() ? ImGuiTreeNodeFlags_Leaf : ImGuiTreeNodeFlags_None;
        if (ImGui::TreeNodeEx(label.c_str(), flags)) {
            if (const auto* p = c.query<PositionComponent>()) {
                const raylib::Vector2 world = p->absolute_position();
                ImGui::Text("pos(%.1f, %.1f) world(%.1f, %.1f)", p->position.x, p->position.y, world.x, world.y);
            }
            c.children().for_each_reversed([](Component& child) { draw_node(child); });
            ImGui::TreePop();
        }
        ImGui::PopID();
    }
};

}  // namespace ember
