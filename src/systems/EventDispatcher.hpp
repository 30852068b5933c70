#pragma once

#include "../components/Component.hpp"
#include "../components/ComponentSet.hpp"
#include "../core/Events.hpp"

namespace ember {

// Entry points the host loop calls once per raw input sample. Each walks the root set front to
// back (last added first), depth first, children before their parent, and stops at the first
// handler that returns false. The return value is true when nobody claimed the event.
//
// Pending structural changes are flushed before a walk starts; changes requested during the walk
// wait for the next one.
class EventDispatcher {
public:
    explicit EventDispatcher(ComponentSet& root) : root_(root) {}

    bool drag_start(int pointer_id, const DragStartInfo& info);
    bool drag_update(int pointer_id, const DragUpdateInfo& info);
    bool drag_end(int pointer_id, const DragEndInfo& info);
    bool drag_cancel(int pointer_id);

    bool tap_down(int pointer_id, const TapDownInfo& info);
    bool tap_up(int pointer_id, const TapUpInfo& info);
    bool tap_cancel(int pointer_id);

    bool mouse_move(const PointerHoverInfo& info);
    bool scroll(const PointerScrollInfo& info);

    // Generic walk; `handler` receives Capability& and returns the continue flag.
    template <typename Capability, typename Handler>
    bool dispatch(Handler&& handler) {
        root_.apply_pending();
        const ComponentSet::Cycle cycle(root_);
        return Component::propagate<Capability>(root_, handler);
    }

private:
    ComponentSet& root_;
};

}  // namespace ember
