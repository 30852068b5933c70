#pragma once

#include <memory>
#include <raylib-cpp.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "../game/Game.hpp"

namespace ember::stories {

// Nested draggable squares: the front-most square under the pointer wins, children before parents.
class DragStory : public Game {
public:
    explicit DragStory(const raylib::Vector2& viewport);
};

// Tap squares to recolor them; a tap nobody claims drops a new square there.
class TapStory : public Game {
public:
    explicit TapStory(const raylib::Vector2& viewport);
    bool on_tap_up(int pointer_id, const TapUpInfo& info) override;

private:
    int spawned_ = 0;
};

class HoverStory : public Game {
public:
    explicit HoverStory(const raylib::Vector2& viewport);
};

// Mouse wheel zooms around the cursor while the camera follows an orbiting circle.
class ZoomStory : public Game {
public:
    explicit ZoomStory(const raylib::Vector2& viewport);
    bool on_scroll(const PointerScrollInfo& info) override;
};

[[nodiscard]] const std::vector<std::string>& story_names();
// Throws std::invalid_argument for unknown names.
[[nodiscard]] std::unique_ptr<Game> make_story(std::string_view name, const raylib::Vector2& viewport);

}  // namespace ember::stories
