#pragma once

#include <raylib-cpp.hpp>

namespace ember {

// Normalized point of a component's bounds that `position` refers to.
struct Anchor {
    float x = 0.0F;
    float y = 0.0F;

    [[nodiscard]] raylib::Vector2 of(const ::Vector2& size) const { return raylib::Vector2{size.x * x, size.y * y}; }

    bool operator==(const Anchor&) const = default;
};

namespace anchors {
inline constexpr Anchor top_left{0.0F, 0.0F};
inline constexpr Anchor top_center{0.5F, 0.0F};
inline constexpr Anchor top_right{1.0F, 0.0F};
inline constexpr Anchor center_left{0.0F, 0.5F};
inline constexpr Anchor center{0.5F, 0.5F};
inline constexpr Anchor center_right{1.0F, 0.5F};
inline constexpr Anchor bottom_left{0.0F, 1.0F};
inline constexpr Anchor bottom_center{0.5F, 1.0F};
inline constexpr Anchor bottom_right{1.0F, 1.0F};
}  // namespace anchors

}  // namespace ember
