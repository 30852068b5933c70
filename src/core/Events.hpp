#pragma once

#include <raylib-cpp.hpp>

namespace ember {

// One sample point expressed in device (screen pixels) and game (world) space.
struct EventPosition {
    raylib::Vector2 global{0.0F, 0.0F};
    raylib::Vector2 game{0.0F, 0.0F};
};

struct EventDelta {
    raylib::Vector2 global{0.0F, 0.0F};
    raylib::Vector2 game{0.0F, 0.0F};
};

struct DragStartInfo {
    EventPosition event_position;
};

struct DragUpdateInfo {
    EventPosition event_position;
    EventDelta delta;
};

struct DragEndInfo {
    raylib::Vector2 velocity{0.0F, 0.0F};  // device pixels per second
};

struct TapDownInfo {
    EventPosition event_position;
};

struct TapUpInfo {
    EventPosition event_position;
};

struct PointerHoverInfo {
    EventPosition event_position;
};

struct PointerScrollInfo {
    EventPosition event_position;
    EventDelta scroll_delta;
};

}  // namespace ember
