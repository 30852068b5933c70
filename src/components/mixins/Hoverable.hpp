#pragma once

#include "../../core/Events.hpp"
#include "../Component.hpp"

namespace ember {

// Tracks whether the mouse is over the component and reports the transitions.
class Hoverable : public virtual Component {
public:
    virtual void on_hover_enter(const PointerHoverInfo& /*info*/) {}
    virtual void on_hover_leave(const PointerHoverInfo& /*info*/) {}

    void handle_mouse_movement(const PointerHoverInfo& info) {
        const bool inside = contains_point(info.event_position.game);
        if (inside == hovered_) return;
        hovered_ = inside;
        if (inside)
            on_hover_enter(info);
        else
            on_hover_leave(info);
    }

    [[nodiscard]] bool is_hovered() const { return hovered_; }

private:
    bool hovered_ = false;
};

}  // namespace ember
