/// @file math_types.cpp
/// @brief Vector3 and Mat4 arithmetic.

#include "sedit/scene/math_types.hpp"

#include <numbers>

namespace sedit::scene {

Mat4 Mat4::operator*(const Mat4& rhs) const noexcept {
    Mat4 out;
    for (std::size_t col = 0; col < 4; ++col) {
        for (std::size_t row = 0; row < 4; ++row) {
            float sum = 0.0f;
            for (std::size_t k = 0; k < 4; ++k) {
                sum += at(row, k) * rhs.at(k, col);
            }
            out.at(row, col) = sum;
        }
    }
    return out;
}

Vector3 Mat4::TransformPoint(const Vector3& p) const noexcept {
    return {at(0, 0) * p.x + at(0, 1) * p.y + at(0, 2) * p.z + at(0, 3),
            at(1, 0) * p.x + at(1, 1) * p.y + at(1, 2) * p.z + at(1, 3),
            at(2, 0) * p.x + at(2, 1) * p.y + at(2, 2) * p.z + at(2, 3)};
}

Mat4 Mat4::FromTRS(const Vector3& translation, const Vector3& rotationDegrees,
                   const Vector3& scale) noexcept {
    constexpr float kDegToRad = std::numbers::pi_v<float> / 180.0f;
    const float cx = std::cos(rotationDegrees.x * kDegToRad);
    const float sx = std::sin(rotationDegrees.x * kDegToRad);
    const float cy = std::cos(rotationDegrees.y * kDegToRad);
    const float sy = std::sin(rotationDegrees.y * kDegToRad);
    const float cz = std::cos(rotationDegrees.z * kDegToRad);
    const float sz = std::sin(rotationDegrees.z * kDegToRad);

    // R = Rz * Ry * Rx
    const float r00 = cz * cy;
    const float r01 = cz * sy * sx - sz * cx;
    const float r02 = cz * sy * cx + sz * sx;
    const float r10 = sz * cy;
    const float r11 = sz * sy * sx + cz * cx;
    const float r12 = sz * sy * cx - cz * sx;
    const float r20 = -sy;
    const float r21 = cy * sx;
    const float r22 = cy * cx;

    Mat4 out;
    out.at(0, 0) = r00 * scale.x;
    out.at(0, 1) = r01 * scale.y;
    out.at(0, 2) = r02 * scale.z;
    out.at(1, 0) = r10 * scale.x;
    out.at(1, 1) = r11 * scale.y;
    out.at(1, 2) = r12 * scale.z;
    out.at(2, 0) = r20 * scale.x;
    out.at(2, 1) = r21 * scale.y;
    out.at(2, 2) = r22 * scale.z;
    out.at(0, 3) = translation.x;
    out.at(1, 3) = translation.y;
    out.at(2, 3) = translation.z;
    return out;
}

bool ApproxEqual(const Vector3& a, const Vector3& b, float epsilon) noexcept {
    return std::fabs(a.x - b.x) <= epsilon && std::fabs(a.y - b.y) <= epsilon &&
           std::fabs(a.z - b.z) <= epsilon;
}

bool ApproxEqual(const Mat4& a, const Mat4& b, float epsilon) noexcept {
    for (std::size_t i = 0; i < a.m.size(); ++i) {
        if (std::fabs(a.m[i] - b.m[i]) > epsilon) {
            return false;
        }
    }
    return true;
}

} // namespace sedit::scene
