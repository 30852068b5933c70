#pragma once

#include <raylib-cpp.hpp>
#include <raymath.h>

namespace ember {

inline float length2(const ::Vector2& v) { return v.x * v.x + v.y * v.y; }
inline float rad_to_deg(const float radians) { return radians * RAD2DEG; }

inline raylib::Vector2 rotate(const ::Vector2& v, const float radians) {
    if (radians == 0.0F) return raylib::Vector2{v};
    return raylib::Vector2{Vector2Rotate(v, radians)};
}

// Component-wise product and quotient.
inline raylib::Vector2 mul(const ::Vector2& a, const ::Vector2& b) { return raylib::Vector2{a.x * b.x, a.y * b.y}; }
inline raylib::Vector2 div(const ::Vector2& a, const ::Vector2& b) { return raylib::Vector2{a.x / b.x, a.y / b.y}; }

}  // namespace ember
