#include "EventDispatcher.hpp"

#include "../components/mixins/Draggable.hpp"
#include "../components/mixins/Hoverable.hpp"
#include "../components/mixins/Scrollable.hpp"
#include "../components/mixins/Tappable.hpp"

namespace ember {

bool EventDispatcher::drag_start(const int pointer_id, const DragStartInfo& info) {
    return dispatch<Draggable>([&](Draggable& c) { return c.handle_drag_start(pointer_id, info); });
}

bool EventDispatcher::drag_update(const int pointer_id, const DragUpdateInfo& info) {
    return dispatch<Draggable>([&](Draggable& c) { return c.handle_drag_update(pointer_id, info); });
}

bool EventDispatcher::drag_end(const int pointer_id, const DragEndInfo& info) {
    return dispatch<Draggable>([&](Draggable& c) { return c.handle_drag_end(pointer_id, info); });
}

bool EventDispatcher::drag_cancel(const int pointer_id) {
    return dispatch<Draggable>([&](Draggable& c) { return c.handle_drag_cancel(pointer_id); });
}

bool EventDispatcher::tap_down(const int pointer_id, const TapDownInfo& info) {
    return dispatch<Tappable>([&](Tappable& c) { return c.handle_tap_down(pointer_id, info); });
}

bool EventDispatcher::tap_up(const int pointer_id, const TapUpInfo& info) {
    return dispatch<Tappable>([&](Tappable& c) { return c.handle_tap_up(pointer_id, info); });
}

bool EventDispatcher::tap_cancel(const int pointer_id) {
    return dispatch<Tappable>([&](Tappable& c) { return c.handle_tap_cancel(pointer_id); });
}

bool EventDispatcher::mouse_move(const PointerHoverInfo& info) {
    return dispatch<Hoverable>([&](Hoverable& c) {
        c.handle_mouse_movement(info);
        return true;
    });
}

bool EventDispatcher::scroll(const PointerScrollInfo& info) {
    return dispatch<Scrollable>([&](Scrollable& c) { return c.handle_scroll(info); });
}

}  // namespace ember
