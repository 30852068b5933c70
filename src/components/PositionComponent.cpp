#include "PositionComponent.hpp"

#include <raylib.h>
#include <rlgl.h>

#include "../core/Constants.hpp"
#include "../core/Geometry.hpp"
#include "../core/Math.hpp"

namespace ember {

PositionComponent::PositionComponent(const raylib::Vector2& position, const raylib::Vector2& size, const Anchor anchor)
    : position(position), size(size), anchor(anchor) {}

const PositionComponent* PositionComponent::positioned_parent() const {
    return dynamic_cast<const PositionComponent*>(parent());
}

raylib::Vector2 PositionComponent::to_world(const raylib::Vector2& local) const {
    const raylib::Vector2 from_anchor = local - anchor.of(size);
    const raylib::Vector2 in_parent = position + rotate(mul(from_anchor, scale), angle);
    if (const auto* p = positioned_parent()) return p->to_world(in_parent);
    return in_parent;
}

raylib::Vector2 PositionComponent::world_to_parent(const raylib::Vector2& world) const {
    if (const auto* p = positioned_parent()) return p->to_local(world);
    return world;
}

raylib::Vector2 PositionComponent::to_local(const raylib::Vector2& world) const {
    const raylib::Vector2 in_parent = world_to_parent(world);
    const raylib::Vector2 unrotated = rotate(in_parent - position, -angle);
    return div(unrotated, scale) + anchor.of(size);
}

raylib::Vector2 PositionComponent::absolute_position() const { return to_world(anchor.of(size)); }

raylib::Vector2 PositionComponent::absolute_center() const {
    return to_world(raylib::Vector2{size.x * 0.5F, size.y * 0.5F});
}

bool PositionComponent::contains_point(const raylib::Vector2& world_position) const {
    if (scale.x == 0.0F || scale.y == 0.0F) return false;
    return contains_local_point(to_local(world_position));
}

bool PositionComponent::contains_local_point(const raylib::Vector2& local) const {
    return geometry::rect_contains(local, raylib::Vector2{0.0F, 0.0F}, size);
}

void PositionComponent::render_tree(const bool debug) const {
    rlPushMatrix();
    rlTranslatef(position.x, position.y, 0.0F);
    rlRotatef(rad_to_deg(angle), 0.0F, 0.0F, 1.0F);
    rlScalef(scale.x, scale.y, 1.0F);
    const raylib::Vector2 origin = anchor.of(size);
    rlTranslatef(-origin.x, -origin.y, 0.0F);
    render();
    if (debug) render_debug();
    render_children(debug);
    rlPopMatrix();
}

void PositionComponent::render_debug() const {
    DrawRectangleLinesEx(::Rectangle{0.0F, 0.0F, size.x, size.y}, constants::debug_line_width, constants::debug_color);
}

}  // namespace ember
