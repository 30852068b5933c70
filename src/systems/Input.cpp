#include "Input.hpp"

#include <utility>
#include <vector>

#include "../core/Math.hpp"

namespace ember {

std::optional<int> GestureRecognizer::gesture_id(const int slot) const {
    if (const auto it = tracks_.find(slot); it != tracks_.end()) return it->second.gesture_id;
    return std::nullopt;
}

bool GestureRecognizer::is_dragging(const int slot) const {
    const auto it = tracks_.find(slot);
    return it != tracks_.end() && it->second.dragging;
}

void GestureRecognizer::pointer_down(const int slot, const raylib::Vector2& device_position) {
    if (tracks_.count(slot) != 0) {
        // Missed release from the device; close the old gesture before opening a new one.
        TraceLog(LOG_WARNING, "EMBER: pointer slot %d pressed twice, cancelling previous gesture", slot);
        pointer_cancel(slot);
    }
    Track track{};
    track.gesture_id = next_gesture_id_++;
    track.down = device_position;
    track.last = device_position;
    track.last_time = clock_;
    const int id = track.gesture_id;
    tracks_.emplace(slot, track);
    game_.on_tap_down(id, TapDownInfo{game_.event_position(device_position)});
}

void GestureRecognizer::begin_drag(Track& track) {
    track.dragging = true;
    TraceLog(LOG_DEBUG, "EMBER: gesture %d became a drag", track.gesture_id);
    game_.on_tap_cancel(track.gesture_id);
    game_.on_drag_start(track.gesture_id, DragStartInfo{game_.event_position(track.down)});
}

void GestureRecognizer::pointer_move(const int slot, const raylib::Vector2& device_position) {
    const auto it = tracks_.find(slot);
    if (it == tracks_.end()) return;
    Track& track = it->second;
    if (device_position.x == track.last.x && device_position.y == track.last.y) return;

    if (!track.dragging) {
        const float slop = game_.config().drag_slop_px;
        if (length2(device_position - track.down) <= slop * slop) return;
        begin_drag(track);
    }

    const raylib::Vector2 delta = device_position - track.last;
    const double elapsed = clock_ - track.last_time;
    if (elapsed > 0.0) track.velocity = delta * static_cast<float>(1.0 / elapsed);
    track.last = device_position;
    track.last_time = clock_;

    game_.on_drag_update(track.gesture_id,
                         DragUpdateInfo{game_.event_position(device_position), game_.event_delta(delta)});
}

void GestureRecognizer::pointer_up(const int slot, const raylib::Vector2& device_position) {
    const auto it = tracks_.find(slot);
    if (it == tracks_.end()) return;
    const Track track = it->second;
    tracks_.erase(it);
    if (track.dragging) {
        game_.on_drag_end(track.gesture_id, DragEndInfo{track.velocity});
    } else {
        game_.on_tap_up(track.gesture_id, TapUpInfo{game_.event_position(device_position)});
    }
}

void GestureRecognizer::pointer_cancel(const int slot) {
    const auto it = tracks_.find(slot);
    if (it == tracks_.end()) return;
    const Track track = it->second;
    tracks_.erase(it);
    if (track.dragging) {
        game_.on_drag_cancel(track.gesture_id);
    } else {
        game_.on_tap_cancel(track.gesture_id);
    }
}

void GestureRecognizer::cancel_all() {
    std::vector<int> slots;
    slots.reserve(tracks_.size());
    for (const auto& [slot, track] : tracks_) slots.push_back(slot);
    for (const int slot : slots) pointer_cancel(slot);
}

void GestureRecognizer::hover(const raylib::Vector2& device_position) {
    game_.on_mouse_move(PointerHoverInfo{game_.event_position(device_position)});
}

void GestureRecognizer::scroll(const raylib::Vector2& device_position, const raylib::Vector2& wheel_delta) {
    game_.on_scroll(PointerScrollInfo{game_.event_position(device_position), game_.event_delta(wheel_delta)});
}

void RaylibInput::poll(const float dt, const bool ui_captures_mouse) {
    recognizer_.advance(dt);

    if (!IsWindowFocused()) {
        if (recognizer_.active_gestures() > 0) {
            TraceLog(LOG_WARNING, "EMBER: focus lost, cancelling %d gesture(s)",
                     static_cast<int>(recognizer_.active_gestures()));
            recognizer_.cancel_all();
        }
        down_.clear();
        return;
    }

    std::unordered_map<int, raylib::Vector2> now;
    if (const int count = GetTouchPointCount(); count > 0) {
        for (int i = 0; i < count; ++i) now.emplace(GetTouchPointId(i), raylib::Vector2{GetTouchPosition(i)});
    } else if (IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
        now.emplace(kMouseSlot, raylib::Vector2{GetMousePosition()});
    }

    for (const auto& [slot, pos] : down_) {
        if (now.count(slot) == 0) recognizer_.pointer_up(slot, pos);
    }
    for (const auto& [slot, pos] : now) {
        if (down_.count(slot) == 0) {
            if (!ui_captures_mouse) recognizer_.pointer_down(slot, pos);
        } else {
            recognizer_.pointer_move(slot, pos);
        }
    }
    down_ = std::move(now);

    if (ui_captures_mouse) return;

    const raylib::Vector2 mouse{GetMousePosition()};
    if (mouse.x != last_mouse_.x || mouse.y != last_mouse_.y) {
        recognizer_.hover(mouse);
        last_mouse_ = mouse;
    }
    if (const raylib::Vector2 wheel{GetMouseWheelMoveV()}; wheel.x != 0.0F || wheel.y != 0.0F) {
        recognizer_.scroll(mouse, wheel);
    }
}

}  // namespace ember
