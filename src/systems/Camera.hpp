#pragma once

#include <algorithm>
#include <flecs.h>
#include <raylib-cpp.hpp>
#include <raymath.h>

#include "../components/PositionComponent.hpp"
#include "../core/Constants.hpp"

namespace ember {

// Wraps the game camera as a flecs singleton component and provides helpers.
class Camera {
public:
    struct CameraComponent {
        raylib::Camera2D camera;
        const PositionComponent* follow = nullptr;  // cleared by Game when it leaves the tree
    };

    static void init(raylib::Camera2D& cam, const raylib::Vector2& viewport) {
        constexpr float kHalf = 0.5F;
        cam.zoom = 1.0F;
        cam.rotation = 0.0F;
        cam.offset = {viewport.x * kHalf, viewport.y * kHalf};
        cam.target = {viewport.x * kHalf, viewport.y * kHalf};
    }

    static void register_systems(const flecs::world& world, const raylib::Vector2& viewport) {
        CameraComponent comp{};
        init(comp.camera, viewport);
        world.set<CameraComponent>(comp);
    }

    static raylib::Camera2D* get(const flecs::world& world) {
        if (auto* cam = world.get_mut<CameraComponent>()) return &cam->camera;
        return nullptr;
    }

    static void resize(const flecs::world& world, const raylib::Vector2& viewport) {
        if (auto* cam = get(world)) cam->offset = {viewport.x * 0.5F, viewport.y * 0.5F};
    }

    // Zooms by `amount` steps while keeping the world point under `screen_point` fixed.
    static void zoom_at(raylib::Camera2D& cam, const raylib::Vector2& screen_point, const float amount,
                        const float per_unit = constants::zoom_per_scroll_unit) {
        if (amount == 0.0F) return;
        const raylib::Vector2 worldBefore = GetScreenToWorld2D(screen_point, cam);
        cam.zoom = std::clamp(cam.zoom * (1.0F + amount * per_unit), constants::min_zoom, constants::max_zoom);
        const raylib::Vector2 worldAfter = GetScreenToWorld2D(screen_point, cam);
        cam.target = Vector2Add(cam.target, Vector2Subtract(worldBefore, worldAfter));
    }

    static void follow(const flecs::world& world, const PositionComponent* target) {
        if (auto* comp = world.get_mut<CameraComponent>()) comp->follow = target;
    }

    static void unfollow_if(const flecs::world& world, const Component* removed) {
        auto* comp = world.get_mut<CameraComponent>();
        if (comp && comp->follow == removed) comp->follow = nullptr;
    }

    // Centers on the followed component; call after the tree update.
    static void update_follow(const flecs::world& world) {
        auto* comp = world.get_mut<CameraComponent>();
        if (!comp || !comp->follow) return;
        comp->camera.target = comp->follow->absolute_center();
    }

    static raylib::Vector2 screen_to_world(const flecs::world& world, const raylib::Vector2& screen) {
        if (const auto* comp = world.get<CameraComponent>()) return GetScreenToWorld2D(screen, comp->camera);
        return screen;
    }

    static raylib::Vector2 world_to_screen(const flecs::world& world, const raylib::Vector2& point) {
        if (const auto* comp = world.get<CameraComponent>()) return GetWorldToScreen2D(point, comp->camera);
        return point;
    }
};

}  // namespace ember
