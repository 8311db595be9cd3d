#pragma once

/// @file components.hpp
/// @brief Scene components: Transform, Renderer, Camera, Light, Script.
///
/// Plain data records stored in the registry's sparse sets.  All of them
/// are copyable so that snapshots and node duplication can deep-copy an
/// entity without knowing which components it carries.

#include "sedit/scene/math_types.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sedit::scene {

// ── Transform ───────────────────────────────────────────────────────────

/// Local TRS plus cached matrices.
///
/// `local` and `world` are only valid after TransformSystem::Update has
/// run with `dirty == false`.  Anything that edits position, rotation or
/// scale must set `dirty`.
struct Transform {
    Vector3 position;
    Vector3 rotation;                       ///< Euler angles in degrees.
    Vector3 scale{1.0f, 1.0f, 1.0f};
    Mat4 local;
    Mat4 world;
    bool dirty = true;

    /// Convenience constructor used by editor actions and tests.
    [[nodiscard]] static Transform At(const Vector3& position,
                                      const Vector3& rotation = {},
                                      const Vector3& scale = Vector3::One()) {
        Transform t;
        t.position = position;
        t.rotation = rotation;
        t.scale = scale;
        return t;
    }

    /// Same position, rotation and scale (matrices and dirty flag ignored).
    [[nodiscard]] bool SameTRS(const Transform& other) const noexcept {
        return position == other.position && rotation == other.rotation && scale == other.scale;
    }

    bool operator==(const Transform&) const = default;
};

// ── Renderer ────────────────────────────────────────────────────────────

enum class ModelKind : uint8_t {
    Cube = 0,
    Sphere = 1,
    Plane = 2,
    CustomMesh = 3
};

struct Renderer {
    bool visible = true;
    ModelKind model = ModelKind::Cube;
    std::string meshPath;       ///< Only meaningful for CustomMesh.
    std::string materialPath;

    bool operator==(const Renderer&) const = default;
};

// ── Camera ──────────────────────────────────────────────────────────────

struct Camera {
    float fov = 60.0f;          ///< Vertical field of view in degrees.
    float nearPlane = 0.1f;
    float farPlane = 1000.0f;
    bool isMain = false;

    bool operator==(const Camera&) const = default;
};

// ── Light ───────────────────────────────────────────────────────────────

enum class LightType : uint8_t {
    Directional = 0,
    Point = 1,
    Spot = 2
};

struct Light {
    LightType type = LightType::Point;
    std::array<float, 3> color{1.0f, 1.0f, 1.0f};
    float intensity = 1.0f;
    float range = 10.0f;
    float spotAngle = 45.0f;    ///< Degrees, Spot only.

    bool operator==(const Light&) const = default;
};

// ── Script ──────────────────────────────────────────────────────────────

struct Script {
    std::string name;
    std::map<std::string, float> params;

    bool operator==(const Script&) const = default;
};

// ── Enum names ──────────────────────────────────────────────────────────

constexpr std::string_view modelKindName(ModelKind kind) {
    switch (kind) {
        case ModelKind::Cube:       return "cube";
        case ModelKind::Sphere:     return "sphere";
        case ModelKind::Plane:      return "plane";
        case ModelKind::CustomMesh: return "custom_mesh";
    }
    return "cube";
}

constexpr std::string_view lightTypeName(LightType type) {
    switch (type) {
        case LightType::Directional: return "directional";
        case LightType::Point:       return "point";
        case LightType::Spot:        return "spot";
    }
    return "point";
}

std::optional<ModelKind> parseModelKind(std::string_view name);
std::optional<LightType> parseLightType(std::string_view name);

} // namespace sedit::scene
