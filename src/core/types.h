#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gv {

// Filesystem
namespace fs = std::filesystem;
using Path = fs::path;

// Integer types
using i32 = std::int32_t;
using i64 = std::int64_t;
using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Floating point
using f32 = float;
using f64 = double;

// Size type
using usize = std::size_t;

// Machine-space position or displacement (mm or inch, whatever the program uses)
struct Vec3 {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 z{0.0f};

    Vec3() = default;
    Vec3(f32 x_, f32 y_, f32 z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }
    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }
    Vec3 operator*(f32 scalar) const { return {x * scalar, y * scalar, z * scalar}; }
    Vec3 operator/(f32 scalar) const { return {x / scalar, y / scalar, z / scalar}; }

    bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Vec3& other) const { return !(*this == other); }

    f32 dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }
    f32 lengthSquared() const { return dot(*this); }
    f32 length() const;
    bool isFinite() const;
};

// Color
struct Color {
    f32 r{1.0f};
    f32 g{1.0f};
    f32 b{1.0f};
    f32 a{1.0f};

    Color() = default;
    Color(f32 r_, f32 g_, f32 b_, f32 a_ = 1.0f) : r(r_), g(g_), b(b_), a(a_) {}

    static Color fromRGB(u8 r_, u8 g_, u8 b_, u8 a_ = 255) {
        return {r_ / 255.0f, g_ / 255.0f, b_ / 255.0f, a_ / 255.0f};
    }

    static Color fromHex(u32 hex) {
        return fromRGB((hex >> 16) & 0xFF, (hex >> 8) & 0xFF, hex & 0xFF);
    }
};

// Common result type
template <typename T>
using Result = std::optional<T>;

}  // namespace gv
