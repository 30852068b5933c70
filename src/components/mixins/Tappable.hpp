#pragma once

#include "../../core/Events.hpp"
#include "../Component.hpp"
#include "PointerIds.hpp"

namespace ember {

// Tap capability: down registers the pointer when it lands inside the component, up and cancel
// release it. Same return convention as Draggable.
class Tappable : public virtual Component {
public:
    virtual bool on_tap_down(int /*pointer_id*/, const TapDownInfo& /*info*/) { return true; }
    virtual bool on_tap_up(int /*pointer_id*/, const TapUpInfo& /*info*/) { return true; }
    virtual bool on_tap_cancel(int /*pointer_id*/) { return true; }

    bool handle_tap_down(int pointer_id, const TapDownInfo& info);
    bool handle_tap_up(int pointer_id, const TapUpInfo& info);
    bool handle_tap_cancel(int pointer_id);

    [[nodiscard]] bool is_pressed() const { return !tap_pointers_.empty(); }
    [[nodiscard]] const PointerIds& tap_pointers() const { return tap_pointers_; }

private:
    PointerIds tap_pointers_;
};

}  // namespace ember
