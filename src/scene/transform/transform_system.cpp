/// @file transform_system.cpp
/// @brief Dirty-driven local/world matrix refresh over the hierarchy.

#include "sedit/scene/transform_system.hpp"

namespace sedit::scene {

std::size_t TransformSystem::Update(bool force) {
    if (force) {
        for (auto& transform : registry_.Storage<Transform>()) {
            transform.dirty = true;
        }
    }

    std::size_t written = 0;
    for (ecs::Entity top : registry_.GetChildren(ecs::kNullEntity)) {
        written += updateSubtree(top, Mat4::Identity(), false);
    }
    return written;
}

Vector3 TransformSystem::WorldPosition(ecs::Entity entity) const {
    const auto* transform = registry_.GetComponent<Transform>(entity);
    if (transform == nullptr) {
        return Vector3::Zero();
    }
    return transform->dirty ? transform->position : transform->world.Translation();
}

std::size_t TransformSystem::updateSubtree(ecs::Entity entity, const Mat4& parentWorld,
                                           bool parentChanged) {
    std::size_t written = 0;
    bool changed = parentChanged;
    Mat4 world = parentWorld;

    if (auto* transform = registry_.GetComponent<Transform>(entity)) {
        if (transform->dirty) {
            transform->local = Mat4::FromTRS(transform->position, transform->rotation,
                                             transform->scale);
            transform->dirty = false;
            changed = true;
        }
        if (changed) {
            transform->world = parentWorld * transform->local;
            ++written;
        }
        world = transform->world;
    }

    for (ecs::Entity child : registry_.GetChildren(entity)) {
        written += updateSubtree(child, world, changed);
    }
    return written;
}

} // namespace sedit::scene
