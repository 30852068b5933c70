#include "Tappable.hpp"

namespace ember {

bool Tappable::handle_tap_down(const int pointer_id, const TapDownInfo& info) {
    if (!contains_point(info.event_position.game)) return true;
    tap_pointers_.add(pointer_id);
    return on_tap_down(pointer_id, info);
}

bool Tappable::handle_tap_up(const int pointer_id, const TapUpInfo& info) {
    if (!tap_pointers_.remove(pointer_id)) return true;
    return on_tap_up(pointer_id, info);
}

bool Tappable::handle_tap_cancel(const int pointer_id) {
    if (!tap_pointers_.remove(pointer_id)) return true;
    return on_tap_cancel(pointer_id);
}

}  // namespace ember
