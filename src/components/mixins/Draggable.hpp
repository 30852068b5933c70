#pragma once

#include "../../core/Events.hpp"
#include "../Component.hpp"
#include "PointerIds.hpp"

namespace ember {

// Drag capability. Override the on_* hooks; return false from a hook to keep the event from
// reaching components further down the traversal.
//
// The handle_* wrappers are what the dispatcher calls. A pointer id becomes active only when a
// drag starts inside contains_point(); update/end/cancel for ids that are not active are ignored
// and let the event continue.
class Draggable : public virtual Component {
public:
    virtual bool on_drag_start(int /*pointer_id*/, const DragStartInfo& /*info*/) { return true; }
    virtual bool on_drag_update(int /*pointer_id*/, const DragUpdateInfo& /*info*/) { return true; }
    virtual bool on_drag_end(int /*pointer_id*/, const DragEndInfo& /*info*/) { return true; }
    virtual bool on_drag_cancel(int /*pointer_id*/) { return true; }

    bool handle_drag_start(int pointer_id, const DragStartInfo& info);
    bool handle_drag_update(int pointer_id, const DragUpdateInfo& info);
    bool handle_drag_end(int pointer_id, const DragEndInfo& info);
    bool handle_drag_cancel(int pointer_id);

    [[nodiscard]] bool is_dragged() const { return !drag_pointers_.empty(); }
    [[nodiscard]] const PointerIds& drag_pointers() const { return drag_pointers_; }

private:
    PointerIds drag_pointers_;
};

}  // namespace ember
