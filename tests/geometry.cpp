#include <cassert>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include "../src/components/ComponentSet.hpp"
#include "../src/components/ShapeComponents.hpp"
#include "../src/core/Geometry.hpp"

using namespace ember;

namespace {

constexpr float kHalfPi = 1.5707963F;

bool near(const raylib::Vector2& a, const raylib::Vector2& b) {
    return std::abs(a.x - b.x) < 1e-3F && std::abs(a.y - b.y) < 1e-3F;
}

void predicates() {
    assert(geometry::rect_contains({5.0F, 5.0F}, {0.0F, 0.0F}, {10.0F, 10.0F}));
    assert(!geometry::rect_contains({15.0F, 5.0F}, {0.0F, 0.0F}, {10.0F, 10.0F}));
    assert(geometry::circle_contains({3.0F, 4.0F}, {0.0F, 0.0F}, 5.5F));
    assert(!geometry::circle_contains({4.0F, 4.0F}, {0.0F, 0.0F}, 5.5F));

    // Concave "L": the notch is outside.
    const std::vector<raylib::Vector2> ell{{0.0F, 0.0F}, {10.0F, 0.0F}, {10.0F, 4.0F},
                                           {4.0F, 4.0F}, {4.0F, 10.0F}, {0.0F, 10.0F}};
    assert(geometry::polygon_contains({2.0F, 8.0F}, ell));
    assert(geometry::polygon_contains({8.0F, 2.0F}, ell));
    assert(!geometry::polygon_contains({8.0F, 8.0F}, ell));
    assert(!geometry::polygon_contains({1.0F, 1.0F}, {{0.0F, 0.0F}, {5.0F, 5.0F}}));

    // Winding does not matter.
    const std::vector<raylib::Vector2> clockwise{{0.0F, 0.0F}, {0.0F, 10.0F}, {10.0F, 0.0F}};
    assert(geometry::polygon_contains({2.0F, 2.0F}, clockwise));
    assert(!geometry::polygon_contains({8.0F, 8.0F}, clockwise));
}

void rotated_rectangle() {
    RectangleComponent bar({100.0F, 100.0F}, {100.0F, 20.0F}, WHITE, anchors::center);
    assert(bar.contains_point({140.0F, 100.0F}));
    assert(!bar.contains_point({100.0F, 140.0F}));

    bar.angle = kHalfPi;  // now tall and thin around the same center
    assert(bar.contains_point({100.0F, 140.0F}));
    assert(!bar.contains_point({140.0F, 100.0F}));
    assert(near(bar.absolute_center(), {100.0F, 100.0F}));
    assert(near(bar.to_local(bar.to_world({30.0F, 5.0F})), {30.0F, 5.0F}));
}

void nested_transforms() {
    ComponentSet root;
    auto owned = std::make_unique<RectangleComponent>(raylib::Vector2{200.0F, 0.0F}, raylib::Vector2{50.0F, 50.0F},
                                                      WHITE);
    owned->scale = {2.0F, 2.0F};
    RectangleComponent* parent = owned.get();
    root.add(std::move(owned));
    auto* child =
        parent->add(std::make_unique<RectangleComponent>(raylib::Vector2{10.0F, 10.0F}, raylib::Vector2{10.0F, 10.0F},
                                                         WHITE));
    root.apply_pending();

    // Child spans (220, 20) to (240, 40) in the world.
    assert(near(child->absolute_top_left(), {220.0F, 20.0F}));
    assert(child->contains_point({230.0F, 30.0F}));
    assert(!child->contains_point({215.0F, 15.0F}));
    assert(near(child->world_to_parent({230.0F, 30.0F}), {15.0F, 15.0F}));

    parent->scale = {0.0F, 2.0F};
    assert(!parent->contains_point({200.0F, 10.0F}));
}

void circle_and_polygon_components() {
    const CircleComponent dot({50.0F, 50.0F}, 10.0F, RED);
    assert(dot.radius() == 10.0F);
    assert(dot.contains_point({55.0F, 55.0F}));
    assert(!dot.contains_point({58.0F, 58.0F}));  // inside the box, outside the circle

    const PolygonComponent tri({0.0F, 0.0F}, {{10.0F, 10.0F}, {110.0F, 10.0F}, {10.0F, 110.0F}}, GREEN);
    assert(near(tri.size, {100.0F, 100.0F}));
    assert(near(tri.vertices().front(), {0.0F, 0.0F}));
    assert(tri.contains_point({20.0F, 20.0F}));
    assert(!tri.contains_point({80.0F, 80.0F}));

    bool threw = false;
    try {
        const PolygonComponent line({0.0F, 0.0F}, {{0.0F, 0.0F}, {1.0F, 1.0F}}, GREEN);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    predicates();
    rotated_rectangle();
    nested_transforms();
    circle_and_polygon_components();
    return 0;
}
