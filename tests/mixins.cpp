#include <cassert>
#include <memory>

#include "../src/components/ComponentSet.hpp"
#include "../src/systems/EventDispatcher.hpp"
#include "Recording.hpp"

using namespace ember;
using ember::test::at;
using ember::test::Log;
using ember::test::Recorder;

namespace {

const raylib::Vector2 kBox{100.0F, 100.0F};

void tap_tracks_pointer_until_up_or_cancel() {
    Log log;
    Recorder r("r", log, raylib::Vector2{0.0F, 0.0F}, kBox);
    assert(r.handle_tap_down(1, TapDownInfo{at(200.0F, 200.0F)}));
    assert(!r.is_pressed());

    r.handle_tap_down(1, TapDownInfo{at(20.0F, 20.0F)});
    r.handle_tap_down(2, TapDownInfo{at(30.0F, 30.0F)});
    assert(r.tap_pointers().size() == 2);
    r.handle_tap_up(1, TapUpInfo{at(20.0F, 20.0F)});
    r.handle_tap_cancel(2);
    assert(!r.is_pressed());
    assert((log == Log{"r:tap_down", "r:tap_down", "r:tap_up", "r:tap_cancel"}));

    // Nothing left to release.
    r.result = false;
    assert(r.handle_tap_up(1, TapUpInfo{at(20.0F, 20.0F)}));
    assert(r.handle_tap_cancel(2));
    assert(log.size() == 4);
}

void hover_reports_transitions_only() {
    Log log;
    ComponentSet root;
    EventDispatcher dispatcher(root);
    auto owned = std::make_unique<Recorder>("h", log, raylib::Vector2{0.0F, 0.0F}, kBox);
    Recorder* h = owned.get();
    root.add(std::move(owned));

    dispatcher.mouse_move(PointerHoverInfo{at(300.0F, 300.0F)});
    dispatcher.mouse_move(PointerHoverInfo{at(50.0F, 50.0F)});
    dispatcher.mouse_move(PointerHoverInfo{at(60.0F, 60.0F)});
    assert(h->is_hovered());
    dispatcher.mouse_move(PointerHoverInfo{at(300.0F, 60.0F)});
    assert(!h->is_hovered());
    assert((log == Log{"h:hover_enter", "h:hover_leave"}));
}

void hover_reaches_every_component() {
    Log log;
    ComponentSet root;
    EventDispatcher dispatcher(root);
    auto top = std::make_unique<Recorder>("top", log, raylib::Vector2{0.0F, 0.0F}, kBox);
    top->result = false;
    root.add(std::make_unique<Recorder>("bottom", log, raylib::Vector2{0.0F, 0.0F}, kBox));
    root.add(std::move(top));

    // Movement is observed, never claimed.
    assert(dispatcher.mouse_move(PointerHoverInfo{at(10.0F, 10.0F)}));
    assert((log == Log{"top:hover_enter", "bottom:hover_enter"}));
}

void scroll_is_gated_by_containment() {
    Log log;
    ComponentSet root;
    EventDispatcher dispatcher(root);
    auto front = std::make_unique<Recorder>("front", log, raylib::Vector2{0.0F, 0.0F}, kBox);
    front->result = false;
    root.add(std::make_unique<Recorder>("back", log, raylib::Vector2{0.0F, 0.0F}, raylib::Vector2{400.0F, 400.0F}));
    root.add(std::move(front));

    const EventDelta wheel{raylib::Vector2{0.0F, 1.0F}, raylib::Vector2{0.0F, 1.0F}};
    assert(!dispatcher.scroll(PointerScrollInfo{at(50.0F, 50.0F), wheel}));
    assert(dispatcher.scroll(PointerScrollInfo{at(250.0F, 250.0F), wheel}));
    assert((log == Log{"front:scroll", "back:scroll"}));
}

}  // namespace

int main() {
    tap_tracks_pointer_until_up_or_cancel();
    hover_reports_transitions_only();
    hover_reaches_every_component();
    scroll_is_gated_by_containment();
    return 0;
}
