#pragma once

#include <string>
#include <utility>
#include <vector>

#include "../src/components/ShapeComponents.hpp"
#include "../src/components/mixins/Draggable.hpp"
#include "../src/components/mixins/Hoverable.hpp"
#include "../src/components/mixins/Scrollable.hpp"
#include "../src/components/mixins/Tappable.hpp"

namespace ember::test {

using Log = std::vector<std::string>;

inline EventPosition at(const float x, const float y) {
    return EventPosition{raylib::Vector2{x, y}, raylib::Vector2{x, y}};
}

// Rectangle that appends "<name>:<hook>" to a shared log for every hook the dispatcher reaches.
class Recorder : public RectangleComponent, public Draggable, public Tappable, public Hoverable, public Scrollable {
public:
    Recorder(std::string name, Log& log, const raylib::Vector2& position, const raylib::Vector2& size)
        : RectangleComponent(position, size, WHITE), name_(std::move(name)), log_(log) {}

    bool result = true;  // what every bool hook returns

    bool on_drag_start(int /*pointer_id*/, const DragStartInfo& /*info*/) override { return record("drag_start"); }
    bool on_drag_update(int /*pointer_id*/, const DragUpdateInfo& /*info*/) override {
        return record("drag_update");
    }
    bool on_drag_end(int /*pointer_id*/, const DragEndInfo& /*info*/) override { return record("drag_end"); }
    bool on_drag_cancel(int /*pointer_id*/) override { return record("drag_cancel"); }

    bool on_tap_down(int /*pointer_id*/, const TapDownInfo& /*info*/) override { return record("tap_down"); }
    bool on_tap_up(int /*pointer_id*/, const TapUpInfo& /*info*/) override { return record("tap_up"); }
    bool on_tap_cancel(int /*pointer_id*/) override { return record("tap_cancel"); }

    void on_hover_enter(const PointerHoverInfo& /*info*/) override { record("hover_enter"); }
    void on_hover_leave(const PointerHoverInfo& /*info*/) override { record("hover_leave"); }

    bool on_scroll(const PointerScrollInfo& /*info*/) override { return record("scroll"); }

private:
    bool record(const char* hook) {
        log_.push_back(name_ + ":" + hook);
        return result;
    }

    std::string name_;
    Log& log_;
};

// Plain component that records its lifecycle.
class Lifecycle : public Component {
public:
    Lifecycle(std::string name, Log& log) : name_(std::move(name)), log_(log) {}
    ~Lifecycle() override { log_.push_back(name_ + ":destroyed"); }

    void update(float /*dt*/) override { log_.push_back(name_ + ":update"); }

protected:
    void on_mount() override { log_.push_back(name_ + ":mount"); }
    void on_remove() override { log_.push_back(name_ + ":remove"); }

private:
    std::string name_;
    Log& log_;
};

}  // namespace ember::test
