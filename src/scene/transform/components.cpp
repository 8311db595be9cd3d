/// @file components.cpp
/// @brief Name lookup for the component enums.

#include "sedit/scene/components.hpp"

namespace sedit::scene {

std::optional<ModelKind> parseModelKind(std::string_view name) {
    for (auto kind : {ModelKind::Cube, ModelKind::Sphere, ModelKind::Plane, ModelKind::CustomMesh}) {
        if (modelKindName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<LightType> parseLightType(std::string_view name) {
    for (auto type : {LightType::Directional, LightType::Point, LightType::Spot}) {
        if (lightTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace sedit::scene
