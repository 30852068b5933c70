#pragma once

#include "../../core/Events.hpp"
#include "../Component.hpp"

namespace ember {

// Receives scroll-wheel samples over its bounds. Scroll has no gesture lifetime, so there is no
// pointer bookkeeping: containment is the only gate.
class Scrollable : public virtual Component {
public:
    virtual bool on_scroll(const PointerScrollInfo& /*info*/) { return true; }

    bool handle_scroll(const PointerScrollInfo& info) {
        if (!contains_point(info.event_position.game)) return true;
        return on_scroll(info);
    }
};

}  // namespace ember
