#pragma once

#include <raylib-cpp.hpp>
#include <string_view>
#include <vector>

#include "PositionComponent.hpp"

namespace ember {

class RectangleComponent : public PositionComponent {
public:
    RectangleComponent() = default;
    RectangleComponent(const raylib::Vector2& position, const raylib::Vector2& size, raylib::Color color,
                       Anchor anchor = anchors::top_left);

    raylib::Color color{WHITE};

    void render() const override;
    [[nodiscard]] std::string_view debug_label() const override { return "RectangleComponent"; }
};

// Circle inscribed in the component's size box.
class CircleComponent : public PositionComponent {
public:
    CircleComponent() = default;
    CircleComponent(const raylib::Vector2& position, float radius, raylib::Color color,
                    Anchor anchor = anchors::center);

    raylib::Color color{WHITE};

    [[nodiscard]] float radius() const;

    void render() const override;
    void render_debug() const override;
    [[nodiscard]] std::string_view debug_label() const override { return "CircleComponent"; }

protected:
    [[nodiscard]] bool contains_local_point(const raylib::Vector2& local) const override;
};

// Convex or concave polygon; vertices are in local space and `size` is their bounding box.
class PolygonComponent : public PositionComponent {
public:
    // Throws std::invalid_argument when given fewer than three vertices.
    PolygonComponent(const raylib::Vector2& position, std::vector<raylib::Vector2> vertices, raylib::Color color,
                     Anchor anchor = anchors::top_left);

    raylib::Color color{WHITE};

    [[nodiscard]] const std::vector<raylib::Vector2>& vertices() const { return vertices_; }

    void render() const override;
    void render_debug() const override;
    [[nodiscard]] std::string_view debug_label() const override { return "PolygonComponent"; }

protected:
    [[nodiscard]] bool contains_local_point(const raylib::Vector2& local) const override;

private:
    std::vector<raylib::Vector2> vertices_;
};

}  // namespace ember
