#include <cassert>
#include <memory>
#include <stdexcept>

#include "../src/components/PositionComponent.hpp"
#include "../src/stories/Stories.hpp"
#include "../src/systems/Input.hpp"

using namespace ember;

namespace {

const raylib::Vector2 kViewport{1280.0F, 720.0F};

PositionComponent* positioned(Component* c) { return dynamic_cast<PositionComponent*>(c); }

void every_story_builds_and_steps() {
    for (const auto& name : stories::story_names()) {
        auto game = stories::make_story(name, kViewport);
        game->step(1.0F / 60.0F);
        assert(!game->components().empty());
    }

    bool threw = false;
    try {
        (void)stories::make_story("missing", kViewport);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void dragging_a_nested_square_leaves_its_parent() {
    auto game = stories::make_story("drag", kViewport);
    game->step(1.0F / 60.0F);

    auto* parent = positioned(game->components().snapshot().at(2));
    auto* child = positioned(parent->children().snapshot().front());
    const raylib::Vector2 parent_before = parent->position;
    const raylib::Vector2 child_before = child->position;
    const raylib::Vector2 grab = child->absolute_center();

    GestureRecognizer gestures(*game);
    gestures.pointer_down(0, grab);
    gestures.pointer_move(0, grab + raylib::Vector2{40.0F, 0.0F});
    gestures.pointer_up(0, grab + raylib::Vector2{40.0F, 0.0F});

    assert(parent->position.x == parent_before.x && parent->position.y == parent_before.y);
    assert(child->position.x > child_before.x + 39.0F && child->position.x < child_before.x + 41.0F);
}

void unclaimed_tap_spawns_a_square() {
    auto game = stories::make_story("tap", kViewport);
    game->step(1.0F / 60.0F);
    const size_t before = game->components().size();

    GestureRecognizer gestures(*game);
    gestures.pointer_down(0, {5.0F, 5.0F});
    gestures.pointer_up(0, {5.0F, 5.0F});
    game->step(1.0F / 60.0F);
    assert(game->components().size() == before + 1);

    // Tapping the new square recolors it instead of spawning another.
    gestures.pointer_down(0, {5.0F, 5.0F});
    gestures.pointer_up(0, {5.0F, 5.0F});
    game->step(1.0F / 60.0F);
    assert(game->components().size() == before + 1);
}

}  // namespace

int main() {
    SetTraceLogLevel(LOG_WARNING);
    every_story_builds_and_steps();
    dragging_a_nested_square_leaves_its_parent();
    unclaimed_tap_spawns_a_square();
    return 0;
}
