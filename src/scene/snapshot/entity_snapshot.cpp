/// @file entity_snapshot.cpp
/// @brief Subtree capture and replay.

#include "sedit/scene/entity_snapshot.hpp"

namespace sedit::scene {

namespace {

template <typename T>
std::optional<T> captureComponent(const ecs::Registry& registry, ecs::Entity entity) {
    const T* component = registry.GetComponent<T>(entity);
    return component ? std::optional<T>(*component) : std::nullopt;
}

template <typename T>
void restoreComponent(ecs::Registry& registry, ecs::Entity entity, const std::optional<T>& value) {
    if (value) {
        registry.AddComponent<T>(entity, *value);
    }
}

} // namespace

std::size_t EntitySnapshot::NodeCount() const {
    std::size_t count = 1;
    for (const auto& child : children) {
        count += child.NodeCount();
    }
    return count;
}

bool EntitySnapshot::operator==(const EntitySnapshot& other) const {
    return name == other.name && active == other.active && tags == other.tags &&
           transform == other.transform && renderer == other.renderer &&
           camera == other.camera && light == other.light && script == other.script &&
           children == other.children;
}

std::optional<EntitySnapshot> CaptureSnapshot(const ecs::Registry& registry, ecs::Entity entity) {
    const auto* record = registry.GetRecord(entity);
    if (record == nullptr) {
        return std::nullopt;
    }

    EntitySnapshot snapshot;
    snapshot.id = entity;
    snapshot.name = record->name;
    snapshot.active = record->active;
    snapshot.tags.assign(record->tags.begin(), record->tags.end());

    snapshot.transform = captureComponent<Transform>(registry, entity);
    if (snapshot.transform) {
        snapshot.transform->local = Mat4::Identity();
        snapshot.transform->world = Mat4::Identity();
        snapshot.transform->dirty = true;
    }
    snapshot.renderer = captureComponent<Renderer>(registry, entity);
    snapshot.camera = captureComponent<Camera>(registry, entity);
    snapshot.light = captureComponent<Light>(registry, entity);
    snapshot.script = captureComponent<Script>(registry, entity);

    snapshot.children.reserve(record->children.size());
    for (ecs::Entity child : record->children) {
        if (auto childSnapshot = CaptureSnapshot(registry, child)) {
            snapshot.children.push_back(std::move(*childSnapshot));
        }
    }
    return snapshot;
}

ecs::Entity RestoreSnapshot(ecs::Registry& registry, const EntitySnapshot& snapshot,
                            ecs::Entity parent, std::size_t index, RestoreIds ids) {
    if (parent.isValid() && !registry.IsAlive(parent)) {
        return ecs::kNullEntity;
    }

    ecs::Entity entity;
    if (ids == RestoreIds::Original) {
        entity = registry.CreateEntity(snapshot.id, snapshot.name);
    }
    if (!entity.isValid()) {
        entity = registry.CreateEntity(snapshot.name);
    }
    registry.SetActive(entity, snapshot.active);
    for (const auto& tag : snapshot.tags) {
        registry.AddTag(entity, tag);
    }

    restoreComponent(registry, entity, snapshot.transform);
    if (auto* transform = registry.GetComponent<Transform>(entity)) {
        transform->dirty = true;
    }
    restoreComponent(registry, entity, snapshot.renderer);
    restoreComponent(registry, entity, snapshot.camera);
    restoreComponent(registry, entity, snapshot.light);
    restoreComponent(registry, entity, snapshot.script);

    // CreateEntity placed the node at the end of the top level.
    if (parent.isValid() || index != ecs::Registry::kAppend) {
        registry.SetParent(entity, parent, index);
    }

    for (const auto& child : snapshot.children) {
        RestoreSnapshot(registry, child, entity, ecs::Registry::kAppend, ids);
    }
    return entity;
}

} // namespace sedit::scene
