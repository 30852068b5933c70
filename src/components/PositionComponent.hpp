#pragma once

#include <raylib-cpp.hpp>
#include <string_view>

#include "../core/Anchor.hpp"
#include "Component.hpp"

namespace ember {

// A component with a placement in its parent's local space.
//
// Local space has its origin at the component's top-left corner and uses unscaled size units.
// `position` places the anchor point inside the parent's local space (or the world for top-level
// components and children of non-positioned parents).
class PositionComponent : public virtual Component {
public:
    PositionComponent() = default;
    PositionComponent(const raylib::Vector2& position, const raylib::Vector2& size, Anchor anchor = anchors::top_left);

    raylib::Vector2 position{0.0F, 0.0F};
    raylib::Vector2 size{0.0F, 0.0F};
    raylib::Vector2 scale{1.0F, 1.0F};
    float angle = 0.0F;  // radians
    Anchor anchor = anchors::top_left;

    [[nodiscard]] raylib::Vector2 to_world(const raylib::Vector2& local) const;
    [[nodiscard]] raylib::Vector2 to_local(const raylib::Vector2& world) const;
    // Expresses a world point in the space `position` lives in.
    [[nodiscard]] raylib::Vector2 world_to_parent(const raylib::Vector2& world) const;

    // World position of the anchor point.
    [[nodiscard]] raylib::Vector2 absolute_position() const;
    [[nodiscard]] raylib::Vector2 absolute_top_left() const { return to_world(raylib::Vector2{0.0F, 0.0F}); }
    [[nodiscard]] raylib::Vector2 absolute_center() const;

    [[nodiscard]] bool contains_point(const raylib::Vector2& world_position) const override;

    void render_tree(bool debug) const override;
    void render_debug() const override;

    [[nodiscard]] std::string_view debug_label() const override { return "PositionComponent"; }

protected:
    // Containment in local coordinates; the default is the size rectangle.
    [[nodiscard]] virtual bool contains_local_point(const raylib::Vector2& local) const;

private:
    [[nodiscard]] const PositionComponent* positioned_parent() const;
};

}  // namespace ember
