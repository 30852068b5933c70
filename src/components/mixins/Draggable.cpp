#include "Draggable.hpp"

namespace ember {

bool Draggable::handle_drag_start(const int pointer_id, const DragStartInfo& info) {
    if (!contains_point(info.event_position.game)) return true;
    drag_pointers_.add(pointer_id);
    return on_drag_start(pointer_id, info);
}

bool Draggable::handle_drag_update(const int pointer_id, const DragUpdateInfo& info) {
    if (!drag_pointers_.contains(pointer_id)) return true;
    return on_drag_update(pointer_id, info);
}

bool Draggable::handle_drag_end(const int pointer_id, const DragEndInfo& info) {
    if (!drag_pointers_.remove(pointer_id)) return true;
    return on_drag_end(pointer_id, info);
}

bool Draggable::handle_drag_cancel(const int pointer_id) {
    if (!drag_pointers_.remove(pointer_id)) return true;
    return on_drag_cancel(pointer_id);
}

}  // namespace ember
