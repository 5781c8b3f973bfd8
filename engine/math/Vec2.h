// Minimal 2D vector for positions and velocities.
#pragma once

#include <cmath>

namespace Engine {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    Vec2() = default;
    Vec2(float xIn, float yIn) : x(xIn), y(yIn) {}

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    Vec2& operator-=(const Vec2& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    Vec2& operator*=(float scalar) {
        x *= scalar;
        y *= scalar;
        return *this;
    }

    float lengthSquared() const { return x * x + y * y; }
    float length() const { return std::sqrt(lengthSquared()); }
};

constexpr float kVecEpsilon = 1e-4f;

inline Vec2 operator*(const Vec2& v, float scalar) { return Vec2{v.x * scalar, v.y * scalar}; }
inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }

inline float dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
inline float distance(const Vec2& a, const Vec2& b) { return (a - b).length(); }

// Returns false and leaves `out` untouched when v is too short to have a direction.
inline bool tryNormalize(const Vec2& v, Vec2& out) {
    const float len2 = v.lengthSquared();
    if (len2 <= kVecEpsilon * kVecEpsilon) {
        return false;
    }
    const float inv = 1.0f / std::sqrt(len2);
    out = Vec2{v.x * inv, v.y * inv};
    return true;
}

}  // namespace Engine
