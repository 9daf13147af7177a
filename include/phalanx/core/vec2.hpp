#pragma once

#include <cmath>

namespace phalanx::core {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Vec2& other) const noexcept {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Vec2& other) const noexcept {
        return !(*this == other);
    }

    Vec2 operator+(const Vec2& other) const noexcept { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const noexcept { return {x - other.x, y - other.y}; }
    Vec2 operator*(double s) const noexcept { return {x * s, y * s}; }
    Vec2 operator/(double s) const noexcept { return {x / s, y / s}; }

    Vec2& operator+=(const Vec2& other) noexcept {
        x += other.x;
        y += other.y;
        return *this;
    }

    Vec2& operator-=(const Vec2& other) noexcept {
        x -= other.x;
        y -= other.y;
        return *this;
    }

    Vec2& operator*=(double s) noexcept {
        x *= s;
        y *= s;
        return *this;
    }

    double length() const noexcept { return std::hypot(x, y); }
    double length_squared() const noexcept { return x * x + y * y; }

    bool is_finite() const noexcept {
        return std::isfinite(x) && std::isfinite(y);
    }

    static Vec2 from_angle(double radians, double magnitude = 1.0) noexcept {
        return {std::cos(radians) * magnitude, std::sin(radians) * magnitude};
    }

    Vec2 rotated(double radians) const noexcept {
        const double c = std::cos(radians);
        const double s = std::sin(radians);
        return {x * c - y * s, x * s + y * c};
    }
};

inline double distance(const Vec2& a, const Vec2& b) noexcept {
    return (b - a).length();
}

} // namespace phalanx::core
