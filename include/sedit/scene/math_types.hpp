#pragma once

/// @file math_types.hpp
/// @brief Small value types for scene transforms.
///
/// Vector3 and a column-major Mat4 are all the editor core needs; the
/// renderer converts them to its own types at the draw boundary.

#include <array>
#include <cmath>
#include <cstddef>

namespace sedit::scene {

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vector3 One() noexcept { return {1.0f, 1.0f, 1.0f}; }

    constexpr bool operator==(const Vector3&) const = default;
};

/// 4x4 float matrix, column-major (m[column * 4 + row]).
struct Mat4 {
    std::array<float, 16> m{1.0f, 0.0f, 0.0f, 0.0f,
                            0.0f, 1.0f, 0.0f, 0.0f,
                            0.0f, 0.0f, 1.0f, 0.0f,
                            0.0f, 0.0f, 0.0f, 1.0f};

    [[nodiscard]] static constexpr Mat4 Identity() noexcept { return {}; }

    [[nodiscard]] constexpr float& at(std::size_t row, std::size_t col) noexcept {
        return m[col * 4 + row];
    }
    [[nodiscard]] constexpr float at(std::size_t row, std::size_t col) const noexcept {
        return m[col * 4 + row];
    }

    [[nodiscard]] Mat4 operator*(const Mat4& rhs) const noexcept;

    /// Transform a point (w = 1).
    [[nodiscard]] Vector3 TransformPoint(const Vector3& p) const noexcept;

    /// Translation column.
    [[nodiscard]] Vector3 Translation() const noexcept {
        return {at(0, 3), at(1, 3), at(2, 3)};
    }

    /// Translate * Rz * Ry * Rx * Scale, rotation given in degrees.
    [[nodiscard]] static Mat4 FromTRS(const Vector3& translation,
                                      const Vector3& rotationDegrees,
                                      const Vector3& scale) noexcept;

    constexpr bool operator==(const Mat4&) const = default;
};

/// Component-wise comparison with tolerance.
[[nodiscard]] bool ApproxEqual(const Vector3& a, const Vector3& b, float epsilon = 1e-4f) noexcept;
[[nodiscard]] bool ApproxEqual(const Mat4& a, const Mat4& b, float epsilon = 1e-4f) noexcept;

} // namespace sedit::scene
