/// @file scene_serializer.cpp
/// @brief YAML encoding of entity snapshots.

#include "sedit/scene/scene_serializer.hpp"

#include "sedit/foundation/editor_logger.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace sedit::scene {

using foundation::EditorError;
using foundation::EditorResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════

YAML::Node encodeVector(const Vector3& v) {
    YAML::Node node;
    node.SetStyle(YAML::EmitterStyle::Flow);
    node.push_back(v.x);
    node.push_back(v.y);
    node.push_back(v.z);
    return node;
}

YAML::Node encodeEntity(const EntitySnapshot& snapshot) {
    YAML::Node node;
    node["name"] = snapshot.name;
    node["active"] = snapshot.active;

    YAML::Node tags(YAML::NodeType::Sequence);
    tags.SetStyle(YAML::EmitterStyle::Flow);
    for (const auto& tag : snapshot.tags) {
        tags.push_back(tag);
    }
    node["tags"] = tags;

    if (const auto& t = snapshot.transform) {
        YAML::Node transform;
        transform["position"] = encodeVector(t->position);
        transform["rotation"] = encodeVector(t->rotation);
        transform["scale"] = encodeVector(t->scale);
        node["transform"] = transform;
    }
    if (const auto& r = snapshot.renderer) {
        YAML::Node renderer;
        renderer["visible"] = r->visible;
        renderer["model"] = std::string(modelKindName(r->model));
        renderer["mesh"] = r->meshPath;
        renderer["material"] = r->materialPath;
        node["renderer"] = renderer;
    }
    if (const auto& c = snapshot.camera) {
        YAML::Node camera;
        camera["fov"] = c->fov;
        camera["near"] = c->nearPlane;
        camera["far"] = c->farPlane;
        camera["main"] = c->isMain;
        node["camera"] = camera;
    }
    if (const auto& l = snapshot.light) {
        YAML::Node light;
        light["type"] = std::string(lightTypeName(l->type));
        YAML::Node color;
        color.SetStyle(YAML::EmitterStyle::Flow);
        for (float channel : l->color) {
            color.push_back(channel);
        }
        light["color"] = color;
        light["intensity"] = l->intensity;
        light["range"] = l->range;
        light["spot_angle"] = l->spotAngle;
        node["light"] = light;
    }
    if (const auto& s = snapshot.script) {
        YAML::Node script;
        script["name"] = s->name;
        YAML::Node params(YAML::NodeType::Map);
        for (const auto& [key, value] : s->params) {
            params[key] = value;
        }
        script["params"] = params;
        node["script"] = script;
    }

    YAML::Node children(YAML::NodeType::Sequence);
    for (const auto& child : snapshot.children) {
        children.push_back(encodeEntity(child));
    }
    node["children"] = children;
    return node;
}

// ═══════════════════════════════════════════════════════════════════════════
// Decoding (yaml-cpp conversion errors propagate to Parse as exceptions)
// ═══════════════════════════════════════════════════════════════════════════

EditorError formatError(std::string message) {
    return EditorError(ErrorCode::SceneFormatError, std::move(message));
}

EditorResult<Vector3> decodeVector(const YAML::Node& node, std::string_view field) {
    if (!node.IsSequence() || node.size() != 3) {
        return EditorResult<Vector3>::err(
            formatError("expected 3 components for '" + std::string(field) + "'"));
    }
    return EditorResult<Vector3>::ok(
        Vector3(node[0].as<float>(), node[1].as<float>(), node[2].as<float>()));
}

EditorResult<Transform> decodeTransform(const YAML::Node& node) {
    Transform transform;
    if (node["position"]) {
        auto v = decodeVector(node["position"], "position");
        if (!v) return EditorResult<Transform>::propagate(v);
        transform.position = v.value();
    }
    if (node["rotation"]) {
        auto v = decodeVector(node["rotation"], "rotation");
        if (!v) return EditorResult<Transform>::propagate(v);
        transform.rotation = v.value();
    }
    if (node["scale"]) {
        auto v = decodeVector(node["scale"], "scale");
        if (!v) return EditorResult<Transform>::propagate(v);
        transform.scale = v.value();
    }
    return EditorResult<Transform>::ok(transform);
}

EditorResult<Renderer> decodeRenderer(const YAML::Node& node) {
    Renderer renderer;
    renderer.visible = node["visible"].as<bool>(true);
    if (node["model"]) {
        auto name = node["model"].as<std::string>();
        auto kind = parseModelKind(name);
        if (!kind) {
            return EditorResult<Renderer>::err(formatError("unknown model kind: " + name));
        }
        renderer.model = *kind;
    }
    renderer.meshPath = node["mesh"].as<std::string>("");
    renderer.materialPath = node["material"].as<std::string>("");
    return EditorResult<Renderer>::ok(renderer);
}

Camera decodeCamera(const YAML::Node& node) {
    Camera camera;
    camera.fov = node["fov"].as<float>(camera.fov);
    camera.nearPlane = node["near"].as<float>(camera.nearPlane);
    camera.farPlane = node["far"].as<float>(camera.farPlane);
    camera.isMain = node["main"].as<bool>(camera.isMain);
    return camera;
}

EditorResult<Light> decodeLight(const YAML::Node& node) {
    Light light;
    if (node["type"]) {
        auto name = node["type"].as<std::string>();
        auto type = parseLightType(name);
        if (!type) {
            return EditorResult<Light>::err(formatError("unknown light type: " + name));
        }
        light.type = *type;
    }
    if (const auto& color = node["color"]) {
        if (!color.IsSequence() || color.size() != 3) {
            return EditorResult<Light>::err(formatError("expected 3 components for 'color'"));
        }
        for (std::size_t i = 0; i < 3; ++i) {
            light.color[i] = color[i].as<float>();
        }
    }
    light.intensity = node["intensity"].as<float>(light.intensity);
    light.range = node["range"].as<float>(light.range);
    light.spotAngle = node["spot_angle"].as<float>(light.spotAngle);
    return EditorResult<Light>::ok(light);
}

Script decodeScript(const YAML::Node& node) {
    Script script;
    script.name = node["name"].as<std::string>("");
    if (const auto& params = node["params"]; params && params.IsMap()) {
        for (auto it = params.begin(); it != params.end(); ++it) {
            script.params[it->first.as<std::string>()] = it->second.as<float>();
        }
    }
    return script;
}

EditorResult<EntitySnapshot> decodeEntity(const YAML::Node& node) {
    if (!node.IsMap()) {
        return EditorResult<EntitySnapshot>::err(formatError("entity entry is not a map"));
    }

    EntitySnapshot snapshot;
    snapshot.name = node["name"].as<std::string>("");
    snapshot.active = node["active"].as<bool>(true);
    if (const auto& tags = node["tags"]) {
        for (const auto& tag : tags) {
            snapshot.tags.push_back(tag.as<std::string>());
        }
    }

    if (const auto& t = node["transform"]) {
        auto transform = decodeTransform(t);
        if (!transform) return EditorResult<EntitySnapshot>::propagate(transform);
        snapshot.transform = transform.value();
    }
    if (const auto& r = node["renderer"]) {
        auto renderer = decodeRenderer(r);
        if (!renderer) return EditorResult<EntitySnapshot>::propagate(renderer);
        snapshot.renderer = renderer.value();
    }
    if (const auto& c = node["camera"]) {
        snapshot.camera = decodeCamera(c);
    }
    if (const auto& l = node["light"]) {
        auto light = decodeLight(l);
        if (!light) return EditorResult<EntitySnapshot>::propagate(light);
        snapshot.light = light.value();
    }
    if (const auto& s = node["script"]) {
        snapshot.script = decodeScript(s);
    }

    if (const auto& children = node["children"]) {
        for (const auto& childNode : children) {
            auto child = decodeEntity(childNode);
            if (!child) return child;
            snapshot.children.push_back(std::move(child).value());
        }
    }
    return EditorResult<EntitySnapshot>::ok(std::move(snapshot));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SceneSerializer
// ═══════════════════════════════════════════════════════════════════════════

std::string SceneSerializer::ToString(const ecs::Registry& registry) {
    YAML::Node root;
    root["version"] = kFormatVersion;

    YAML::Node entities(YAML::NodeType::Sequence);
    for (ecs::Entity top : registry.GetChildren(ecs::kNullEntity)) {
        if (auto snapshot = CaptureSnapshot(registry, top)) {
            entities.push_back(encodeEntity(*snapshot));
        }
    }
    root["entities"] = entities;

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str());
}

EditorResult<std::vector<EntitySnapshot>> SceneSerializer::Parse(std::string_view text) {
    using ParseResult = EditorResult<std::vector<EntitySnapshot>>;
    try {
        auto root = YAML::Load(std::string(text));
        if (!root.IsMap()) {
            return ParseResult::err(formatError("scene document is not a map"));
        }
        auto version = root["version"].as<int>(kFormatVersion);
        if (version != kFormatVersion) {
            return ParseResult::err(
                formatError("unsupported scene version " + std::to_string(version)));
        }
        const auto& entities = root["entities"];
        if (!entities || !entities.IsSequence()) {
            return ParseResult::err(formatError("scene has no 'entities' list"));
        }

        std::vector<EntitySnapshot> snapshots;
        snapshots.reserve(entities.size());
        for (const auto& node : entities) {
            auto snapshot = decodeEntity(node);
            if (!snapshot) {
                return ParseResult::propagate(snapshot);
            }
            snapshots.push_back(std::move(snapshot).value());
        }
        return ParseResult::ok(std::move(snapshots));
    } catch (const YAML::Exception& e) {
        return ParseResult::err(formatError(std::string("YAML error: ") + e.what()));
    }
}

EditorResult<void> SceneSerializer::FromString(ecs::Registry& registry, std::string_view text) {
    auto parsed = Parse(text);
    if (!parsed) {
        return EditorResult<void>::from(parsed);
    }

    registry.Clear();
    for (const auto& snapshot : parsed.value()) {
        RestoreSnapshot(registry, snapshot, ecs::kNullEntity);
    }
    return EditorResult<void>::ok();
}

EditorResult<void> SceneSerializer::Save(const ecs::Registry& registry,
                                         const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return EditorResult<void>::err(
            EditorError(ErrorCode::SceneSaveFailed, "cannot open for writing: " + path.string()));
    }
    file << ToString(registry) << '\n';
    if (!file) {
        return EditorResult<void>::err(
            EditorError(ErrorCode::SceneSaveFailed, "write failed: " + path.string()));
    }
    SEDIT_LOG_INFO(LogCategory::Scene,
                   "saved " + std::to_string(registry.Count()) + " entities to " + path.string());
    return EditorResult<void>::ok();
}

EditorResult<void> SceneSerializer::Load(ecs::Registry& registry,
                                         const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return EditorResult<void>::err(
            EditorError(ErrorCode::SceneLoadFailed, "cannot open scene: " + path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = FromString(registry, buffer.str());
    if (result) {
        SEDIT_LOG_INFO(LogCategory::Scene,
                       "loaded " + std::to_string(registry.Count()) + " entities from " + path.string());
    }
    return result;
}

} // namespace sedit::scene
