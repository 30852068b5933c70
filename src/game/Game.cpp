#include "Game.hpp"

#include <algorithm>
#include <chrono>
#include <raymath.h>
#include <stdexcept>

#include "../systems/Camera.hpp"
#include "../systems/Renderer.hpp"

namespace ember {

Game::Game(const raylib::Vector2& viewport) : dispatcher_(root_), viewport_(viewport) {
    world_.set<Config>({});
    Camera::register_systems(world_, viewport_);
    // The camera must never outlive its target, however the target leaves the tree.
    root_.set_removal_listener([this](const Component& removed) { Camera::unfollow_if(world_, &removed); });
    register_systems();
    TraceLog(LOG_INFO, "EMBER: game created (viewport %.0fx%.0f)", viewport_.x, viewport_.y);
}

Game::~Game() = default;

void Game::register_systems() {
    world_.system<>("ember::TreeUpdate").kind(flecs::OnUpdate).iter([this](flecs::iter& it) {
        const Config& cfg = config();
        if (cfg.paused) return;
        const float baseDt = cfg.use_fixed_dt ? cfg.fixed_dt : static_cast<float>(it.delta_time());
        update(baseDt * std::max(0.0F, cfg.time_scale));
    });

    // Camera follows after components moved this frame.
    world_.system<>("ember::CameraFollow").kind(flecs::PostUpdate).iter([this](flecs::iter&) {
        Camera::update_follow(world_);
    });
}

void Game::remove(const Component* component) { root_.remove(component); }

Config& Game::config() {
    auto* cfg = world_.get_mut<Config>();
    if (cfg == nullptr) throw std::logic_error("Game: Config singleton missing");
    return *cfg;
}

const Config& Game::config() const {
    const auto* cfg = world_.get<Config>();
    if (cfg == nullptr) throw std::logic_error("Game: Config singleton missing");
    return *cfg;
}

raylib::Camera2D& Game::camera() {
    auto* cam = Camera::get(world_);
    if (cam == nullptr) throw std::logic_error("Game: camera singleton missing");
    return *cam;
}

const raylib::Camera2D& Game::camera() const {
    const auto* comp = world_.get<Camera::CameraComponent>();
    if (comp == nullptr) throw std::logic_error("Game: camera singleton missing");
    return comp->camera;
}

void Game::resize(const raylib::Vector2& viewport) {
    viewport_ = viewport;
    Camera::resize(world_, viewport_);
}

void Game::step(const float dt) {
    const auto frameStart = std::chrono::steady_clock::now();
    [[maybe_unused]] auto progress = world_.progress(dt);
    config().last_update_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - frameStart).count();
}

void Game::update(const float dt) {
    root_.apply_pending();
    const ComponentSet::Cycle cycle(root_);
    root_.for_each([dt](Component& c) { c.update_tree(dt); });
}

void Game::render() const { Renderer::render_scene(root_, config(), camera()); }

EventPosition Game::event_position(const raylib::Vector2& device) const {
    return EventPosition{device, GetScreenToWorld2D(device, camera())};
}

EventDelta Game::event_delta(const raylib::Vector2& device_delta) const {
    const raylib::Camera2D& cam = camera();
    const raylib::Vector2 unrotated = Vector2Rotate(device_delta, -cam.rotation * DEG2RAD);
    return EventDelta{device_delta, unrotated * (1.0F / cam.zoom)};
}

bool Game::on_drag_start(const int pointer_id, const DragStartInfo& info) {
    return dispatcher_.drag_start(pointer_id, info);
}

bool Game::on_drag_update(const int pointer_id, const DragUpdateInfo& info) {
    return dispatcher_.drag_update(pointer_id, info);
}

bool Game::on_drag_end(const int pointer_id, const DragEndInfo& info) {
    return dispatcher_.drag_end(pointer_id, info);
}

bool Game::on_drag_cancel(const int pointer_id) { return dispatcher_.drag_cancel(pointer_id); }

bool Game::on_tap_down(const int pointer_id, const TapDownInfo& info) {
    return dispatcher_.tap_down(pointer_id, info);
}

bool Game::on_tap_up(const int pointer_id, const TapUpInfo& info) { return dispatcher_.tap_up(pointer_id, info); }

bool Game::on_tap_cancel(const int pointer_id) { return dispatcher_.tap_cancel(pointer_id); }

bool Game::on_mouse_move(const PointerHoverInfo& info) { return dispatcher_.mouse_move(info); }

bool Game::on_scroll(const PointerScrollInfo& info) { return dispatcher_.scroll(info); }

}  // namespace ember
