#pragma once

#include <array>
#include <cmath>

namespace lorentz {

struct Vec2 {
    double x;
    double y;

    Vec2() : x(0.0), y(0.0) {}
    Vec2(double xIn, double yIn) : x(xIn), y(yIn) {}

    Vec2 operator+(const Vec2& rhs) const { return Vec2(x + rhs.x, y + rhs.y); }
    Vec2 operator-(const Vec2& rhs) const { return Vec2(x - rhs.x, y - rhs.y); }
    Vec2 operator*(double scale) const { return Vec2(x * scale, y * scale); }

    bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
    bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

    double Magnitude() const { return std::sqrt((x * x) + (y * y)); }

    bool IsFinite() const { return std::isfinite(x) && std::isfinite(y); }

    static Vec2 Zero() { return Vec2(0.0, 0.0); }
    static Vec2 FromPair(const std::array<double, 2>& values) { return Vec2(values[0], values[1]); }

    static double Dot(const Vec2& a, const Vec2& b) { return (a.x * b.x) + (a.y * b.y); }
};

inline Vec2 operator*(double scale, const Vec2& v) {
    return v * scale;
}

// Magnetic field vectors only; particle motion stays in the xy-plane.
struct Vec3 {
    double x;
    double y;
    double z;

    Vec3() : x(0.0), y(0.0), z(0.0) {}
    Vec3(double xIn, double yIn, double zIn) : x(xIn), y(yIn), z(zIn) {}

    Vec3 operator+(const Vec3& rhs) const { return Vec3(x + rhs.x, y + rhs.y, z + rhs.z); }
    Vec3 operator-(const Vec3& rhs) const { return Vec3(x - rhs.x, y - rhs.y, z - rhs.z); }
    Vec3 operator*(double scale) const { return Vec3(x * scale, y * scale, z * scale); }

    bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
    bool operator!=(const Vec3& rhs) const { return !(*this == rhs); }

    double Magnitude() const { return std::sqrt((x * x) + (y * y) + (z * z)); }

    bool IsFinite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    static Vec3 Zero() { return Vec3(0.0, 0.0, 0.0); }
};

inline Vec3 operator*(double scale, const Vec3& v) {
    return v * scale;
}

}  // namespace lorentz
