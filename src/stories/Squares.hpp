#pragma once

#include <raylib-cpp.hpp>
#include <string_view>

#include "../components/ShapeComponents.hpp"
#include "../components/mixins/Draggable.hpp"
#include "../components/mixins/Hoverable.hpp"
#include "../components/mixins/Tappable.hpp"
#include "../core/Constants.hpp"

namespace ember::stories {

inline raylib::Vector2 square_extent() { return raylib::Vector2{constants::square_size, constants::square_size}; }

// Follows the pointer that grabbed it and claims the drag.
class DraggableSquare : public RectangleComponent, public Draggable {
public:
    DraggableSquare(const raylib::Vector2& position, const raylib::Vector2& size, raylib::Color idle)
        : RectangleComponent(position, size, idle), idle_(idle) {}

    bool on_drag_start(int /*pointer_id*/, const DragStartInfo& info) override {
        grab_offset_ = world_to_parent(info.event_position.game) - position;
        color = ORANGE;
        return false;
    }

    bool on_drag_update(int /*pointer_id*/, const DragUpdateInfo& info) override {
        position = world_to_parent(info.event_position.game) - grab_offset_;
        return false;
    }

    bool on_drag_end(int /*pointer_id*/, const DragEndInfo& /*info*/) override {
        color = idle_;
        return false;
    }

    bool on_drag_cancel(int /*pointer_id*/) override {
        color = idle_;
        return false;
    }

    [[nodiscard]] std::string_view debug_label() const override { return "DraggableSquare"; }

private:
    raylib::Color idle_;
    raylib::Vector2 grab_offset_{0.0F, 0.0F};
};

// Darkens while pressed, flips between two colors on every completed tap.
class TappableSquare : public RectangleComponent, public Tappable {
public:
    TappableSquare(const raylib::Vector2& position, raylib::Color a, raylib::Color b)
        : RectangleComponent(position, square_extent(), a, anchors::center), a_(a), b_(b) {}

    bool on_tap_down(int /*pointer_id*/, const TapDownInfo& /*info*/) override {
        color = ColorBrightness(current(), -0.4F);
        return false;
    }

    bool on_tap_up(int /*pointer_id*/, const TapUpInfo& /*info*/) override {
        flipped_ = !flipped_;
        color = current();
        return false;
    }

    bool on_tap_cancel(int /*pointer_id*/) override {
        color = current();
        return false;
    }

    [[nodiscard]] std::string_view debug_label() const override { return "TappableSquare"; }

private:
    [[nodiscard]] raylib::Color current() const { return flipped_ ? b_ : a_; }

    raylib::Color a_;
    raylib::Color b_;
    bool flipped_ = false;
};

class HoverableSquare : public RectangleComponent, public Hoverable {
public:
    HoverableSquare(const raylib::Vector2& position, raylib::Color idle)
        : RectangleComponent(position, square_extent(), idle, anchors::center), idle_(idle) {}

    void on_hover_enter(const PointerHoverInfo& /*info*/) override { color = YELLOW; }
    void on_hover_leave(const PointerHoverInfo& /*info*/) override { color = idle_; }

    [[nodiscard]] std::string_view debug_label() const override { return "HoverableSquare"; }

private:
    raylib::Color idle_;
};

// Rotates around its center; containment follows the rotation.
class SpinningSquare : public RectangleComponent, public Draggable {
public:
    SpinningSquare(const raylib::Vector2& position, float speed)
        : RectangleComponent(position, square_extent(), SKYBLUE, anchors::center), speed_(speed) {}

    void update(const float dt) override { angle += speed_ * dt; }

    bool on_drag_update(int /*pointer_id*/, const DragUpdateInfo& info) override {
        position = world_to_parent(info.event_position.game);
        return false;
    }

    [[nodiscard]] std::string_view debug_label() const override { return "SpinningSquare"; }

private:
    float speed_;
};

}  // namespace ember::stories
