#include "ShapeComponents.hpp"

#include <algorithm>
#include <raylib.h>
#include <stdexcept>
#include <utility>

#include "../core/Constants.hpp"
#include "../core/Geometry.hpp"

namespace ember {

RectangleComponent::RectangleComponent(const raylib::Vector2& position, const raylib::Vector2& size,
                                       const raylib::Color color, const Anchor anchor)
    : PositionComponent(position, size, anchor), color(color) {}

void RectangleComponent::render() const { DrawRectangleV(::Vector2{0.0F, 0.0F}, size, color); }

CircleComponent::CircleComponent(const raylib::Vector2& position, const float radius, const raylib::Color color,
                                 const Anchor anchor)
    : PositionComponent(position, raylib::Vector2{radius * 2.0F, radius * 2.0F}, anchor), color(color) {}

float CircleComponent::radius() const { return std::min(size.x, size.y) * 0.5F; }

void CircleComponent::render() const {
    DrawCircleV(::Vector2{size.x * 0.5F, size.y * 0.5F}, radius(), color);
}

void CircleComponent::render_debug() const {
    DrawCircleLinesV(::Vector2{size.x * 0.5F, size.y * 0.5F}, radius(), constants::debug_color);
}

bool CircleComponent::contains_local_point(const raylib::Vector2& local) const {
    return geometry::circle_contains(local, raylib::Vector2{size.x * 0.5F, size.y * 0.5F}, radius());
}

PolygonComponent::PolygonComponent(const raylib::Vector2& position, std::vector<raylib::Vector2> vertices,
                                   const raylib::Color color, const Anchor anchor)
    : color(color), vertices_(std::move(vertices)) {
    if (vertices_.size() < 3) throw std::invalid_argument("PolygonComponent: needs at least 3 vertices");
    raylib::Vector2 lo = vertices_.front();
    raylib::Vector2 hi = vertices_.front();
    for (const auto& v : vertices_) {
        lo = raylib::Vector2{std::min(lo.x, v.x), std::min(lo.y, v.y)};
        hi = raylib::Vector2{std::max(hi.x, v.x), std::max(hi.y, v.y)};
    }
    // Rebase so the bounding box starts at the local origin.
    for (auto& v : vertices_) v = v - lo;
    this->position = position;
    this->size = hi - lo;
    this->anchor = anchor;
}

void PolygonComponent::render() const {
    // Triangle fan from the first vertex: correct for convex polygons given counter-clockwise.
    std::vector<::Vector2> points(vertices_.begin(), vertices_.end());
    DrawTriangleFan(points.data(), static_cast<int>(points.size()), color);
}

void PolygonComponent::render_debug() const {
    for (size_t i = 0; i < vertices_.size(); ++i) {
        DrawLineEx(vertices_[i], vertices_[(i + 1) % vertices_.size()], constants::debug_line_width,
                   constants::debug_color);
    }
}

bool PolygonComponent::contains_local_point(const raylib::Vector2& local) const {
    return geometry::polygon_contains(local, vertices_);
}

}  // namespace ember
