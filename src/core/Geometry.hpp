#pragma once

#include <raylib-cpp.hpp>
#include <vector>

namespace ember::geometry {

// Containment predicates used by component hit tests. All inputs share one coordinate space.

inline bool rect_contains(const ::Vector2& point, const ::Vector2& top_left, const ::Vector2& size) {
    return CheckCollisionPointRec(point, ::Rectangle{top_left.x, top_left.y, size.x, size.y});
}

inline bool circle_contains(const ::Vector2& point, const ::Vector2& center, const float radius) {
    return CheckCollisionPointCircle(point, center, radius);
}

// Even-odd rule; degenerate polygons contain nothing.
inline bool polygon_contains(const ::Vector2& point, const std::vector<raylib::Vector2>& vertices) {
    if (vertices.size() < 3) return false;
    std::vector<::Vector2> points(vertices.begin(), vertices.end());
    return CheckCollisionPointPoly(point, points.data(), static_cast<int>(points.size()));
}

}  // namespace ember::geometry
