#pragma once
#include <cmath>

namespace bmc_2d {

// Point or displacement in the device plane
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2() = default;
    Vec2(double x_, double y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }
    Vec2 operator/(double s) const { return {x / s, y / s}; }
    Vec2 operator-() const { return {-x, -y}; }
    Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
    Vec2& operator-=(const Vec2& o) { x -= o.x; y -= o.y; return *this; }

    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    double dot(const Vec2& o) const { return x * o.x + y * o.y; }
    double cross(const Vec2& o) const { return x * o.y - y * o.x; }
    double norm() const { return std::sqrt(x * x + y * y); }
    double norm2() const { return x * x + y * y; }

    // Counter-clockwise rotation by 90 degrees
    Vec2 perp() const { return {-y, x}; }

    Vec2 normalized() const {
        double n = norm();
        if (n == 0.0) return *this;
        return *this / n;
    }
};

inline Vec2 operator*(double s, const Vec2& v) { return v * s; }

/**
 * @brief Position on the discretized Fermi surface
 *
 * bin  : chord index in [0, N)
 * frac : fraction of chord `bin` still to be traversed. 1 means the carrier
 *        sits at the start of the chord, values below 1 come from a step that
 *        was cut short by a boundary.
 */
struct FermiState {
    int bin = 0;
    double frac = 1.0;

    bool operator==(const FermiState& o) const { return bin == o.bin && frac == o.frac; }
    bool operator!=(const FermiState& o) const { return !(*this == o); }
};

} // namespace bmc_2d
