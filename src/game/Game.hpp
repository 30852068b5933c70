#pragma once

#include <flecs.h>
#include <memory>
#include <raylib-cpp.hpp>
#include <type_traits>
#include <utility>

#include "../components/Component.hpp"
#include "../components/ComponentSet.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"
#include "../core/Events.hpp"
#include "../systems/EventDispatcher.hpp"

namespace ember {

// Root of the component system: owns the top-level components, the flecs world holding the
// engine singletons (Config, camera) and the dispatcher the input bridge feeds.
//
// Gesture entry points are virtual so a game can react to input globally; overrides must call
// the base implementation to keep components receiving events. They return true when no
// component claimed the event.
class Game {
public:
    explicit Game(const raylib::Vector2& viewport = raylib::Vector2{static_cast<float>(constants::window_width),
                                                                    static_cast<float>(constants::window_height)});
    virtual ~Game();
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    template <typename T>
    T* add(std::unique_ptr<T> component) {
        static_assert(std::is_base_of_v<Component, T>, "only components can be added");
        T* raw = component.get();
        root_.add(std::move(component));
        return raw;
    }
    void remove(const Component* component);

    [[nodiscard]] ComponentSet& components() { return root_; }
    [[nodiscard]] const ComponentSet& components() const { return root_; }
    [[nodiscard]] EventDispatcher& dispatcher() { return dispatcher_; }
    [[nodiscard]] const flecs::world& world() const { return world_; }

    [[nodiscard]] Config& config();
    [[nodiscard]] const Config& config() const;
    [[nodiscard]] raylib::Camera2D& camera();
    [[nodiscard]] const raylib::Camera2D& camera() const;
    [[nodiscard]] const raylib::Vector2& viewport() const { return viewport_; }
    void resize(const raylib::Vector2& viewport);

    // Advances one frame through the flecs pipeline (tree update, camera follow).
    void step(float dt);
    // Applies pending structural changes and updates every component. Called by step().
    virtual void update(float dt);
    virtual void render() const;

    [[nodiscard]] EventPosition event_position(const raylib::Vector2& device) const;
    [[nodiscard]] EventDelta event_delta(const raylib::Vector2& device_delta) const;

    virtual bool on_drag_start(int pointer_id, const DragStartInfo& info);
    virtual bool on_drag_update(int pointer_id, const DragUpdateInfo& info);
    virtual bool on_drag_end(int pointer_id, const DragEndInfo& info);
    virtual bool on_drag_cancel(int pointer_id);

    virtual bool on_tap_down(int pointer_id, const TapDownInfo& info);
    virtual bool on_tap_up(int pointer_id, const TapUpInfo& info);
    virtual bool on_tap_cancel(int pointer_id);

    virtual bool on_mouse_move(const PointerHoverInfo& info);
    virtual bool on_scroll(const PointerScrollInfo& info);

private:
    void register_systems();

    flecs::world world_;
    ComponentSet root_;
    EventDispatcher dispatcher_;
    raylib::Vector2 viewport_;
};

}  // namespace ember
