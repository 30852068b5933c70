#pragma once

#include <optional>
#include <raylib-cpp.hpp>
#include <unordered_map>

#include "../game/Game.hpp"

namespace ember {

// Turns raw pointer samples into tap and drag gestures on a Game.
//
// A press fires tap_down immediately. Once the pointer travels further than Config::drag_slop_px
// from where it went down, the tap is cancelled and a drag starts at the down position. Release
// ends whichever gesture is live. Every press gets a fresh gesture id, so ids never repeat
// within a session even when the device reuses its slot numbers.
class GestureRecognizer {
public:
    explicit GestureRecognizer(Game& game) : game_(game) {}

    void advance(float dt) { clock_ += static_cast<double>(dt); }

    void pointer_down(int slot, const raylib::Vector2& device_position);
    void pointer_move(int slot, const raylib::Vector2& device_position);
    void pointer_up(int slot, const raylib::Vector2& device_position);
    void pointer_cancel(int slot);
    void cancel_all();

    void hover(const raylib::Vector2& device_position);
    void scroll(const raylib::Vector2& device_position, const raylib::Vector2& wheel_delta);

    [[nodiscard]] size_t active_gestures() const { return tracks_.size(); }
    [[nodiscard]] std::optional<int> gesture_id(int slot) const;
    [[nodiscard]] bool is_dragging(int slot) const;

private:
    struct Track {
        int gesture_id = 0;
        raylib::Vector2 down{0.0F, 0.0F};
        raylib::Vector2 last{0.0F, 0.0F};
        raylib::Vector2 velocity{0.0F, 0.0F};
        double last_time = 0.0;
        bool dragging = false;
    };

    void begin_drag(Track& track);

    Game& game_;
    std::unordered_map<int, Track> tracks_;
    int next_gesture_id_ = 1;
    double clock_ = 0.0;
};

// Polls raylib once per frame and feeds a GestureRecognizer. Touch points are used when the
// platform reports any; otherwise the left mouse button acts as a single pointer.
class RaylibInput {
public:
    static constexpr int kMouseSlot = -1;

    explicit RaylibInput(GestureRecognizer& recognizer) : recognizer_(recognizer) {}

    // `ui_captures_mouse`: new presses, hover and wheel are withheld; live gestures still finish.
    void poll(float dt, bool ui_captures_mouse);

private:
    GestureRecognizer& recognizer_;
    std::unordered_map<int, raylib::Vector2> down_;  // slot -> last position
    raylib::Vector2 last_mouse_{-1.0F, -1.0F};
};

}  // namespace ember
