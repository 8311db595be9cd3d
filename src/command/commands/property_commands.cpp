/// @file property_commands.cpp
/// @brief Commands that edit a single entity in place: rename, transform,
///        active flag and parent.

#include "sedit/command/commands.hpp"

#include "command_checks.hpp"

namespace sedit::command {

using foundation::EditorResult;
using foundation::ErrorCode;

namespace {

void markTransformDirty(ecs::Registry& registry, ecs::Entity entity) {
    if (auto* transform = registry.GetComponent<scene::Transform>(entity)) {
        transform->dirty = true;
    }
}

} // namespace

// ── RenameEntityCommand ─────────────────────────────────────────────────

RenameEntityCommand::RenameEntityCommand(ecs::Entity entity, std::string newName)
    : entity_(entity), newName_(std::move(newName)) {}

EditorResult<void> RenameEntityCommand::Validate(const ecs::Registry& registry) const {
    if (newName_.empty()) {
        return detail::reject(ErrorCode::InvalidCommand, Name(), "name must not be empty", entity_);
    }
    return detail::requireEditable(registry, Name(), entity_);
}

void RenameEntityCommand::Apply(ecs::Registry& registry) {
    oldName_ = registry.GetName(entity_);
    registry.SetName(entity_, newName_);
}

void RenameEntityCommand::Revert(ecs::Registry& registry) {
    registry.SetName(entity_, oldName_);
}

// ── ModifyTransformCommand ──────────────────────────────────────────────

ModifyTransformCommand::ModifyTransformCommand(ecs::Entity entity, scene::Transform newValue)
    : entity_(entity), newValue_(std::move(newValue)) {}

EditorResult<void> ModifyTransformCommand::Validate(const ecs::Registry& registry) const {
    auto editable = detail::requireEditable(registry, Name(), entity_);
    if (!editable) {
        return editable;
    }
    if (!registry.HasComponent<scene::Transform>(entity_)) {
        return detail::reject(ErrorCode::ComponentNotFound, Name(),
                              "entity " + std::to_string(entity_.id()) + " has no Transform",
                              entity_);
    }
    return EditorResult<void>::ok();
}

void ModifyTransformCommand::Apply(ecs::Registry& registry) {
    auto* transform = registry.GetComponent<scene::Transform>(entity_);
    if (transform == nullptr) {
        return;
    }
    oldValue_ = *transform;
    *transform = newValue_;
    transform->dirty = true;
}

void ModifyTransformCommand::Revert(ecs::Registry& registry) {
    auto* transform = registry.GetComponent<scene::Transform>(entity_);
    if (transform == nullptr) {
        return;
    }
    *transform = oldValue_;
    // The cached matrices may predate later hierarchy changes.
    transform->dirty = true;
}

// ── SetActiveCommand ────────────────────────────────────────────────────

SetActiveCommand::SetActiveCommand(ecs::Entity entity, bool active)
    : entity_(entity), active_(active) {}

EditorResult<void> SetActiveCommand::Validate(const ecs::Registry& registry) const {
    return detail::requireEditable(registry, Name(), entity_);
}

void SetActiveCommand::Apply(ecs::Registry& registry) {
    wasActive_ = registry.IsActive(entity_);
    registry.SetActive(entity_, active_);
}

void SetActiveCommand::Revert(ecs::Registry& registry) {
    registry.SetActive(entity_, wasActive_);
}

// ── ReparentEntityCommand ───────────────────────────────────────────────

ReparentEntityCommand::ReparentEntityCommand(ecs::Entity entity, ecs::Entity newParent,
                                             std::size_t index)
    : entity_(entity), newParent_(newParent), newIndex_(index) {}

EditorResult<void> ReparentEntityCommand::Validate(const ecs::Registry& registry) const {
    auto editable = detail::requireEditable(registry, Name(), entity_);
    if (!editable) {
        return editable;
    }
    auto parent = detail::requireParent(registry, Name(), newParent_);
    if (!parent) {
        return parent;
    }
    if (entity_ == newParent_ || registry.IsAncestorOf(entity_, newParent_)) {
        return detail::reject(ErrorCode::CyclicHierarchy, Name(),
                              "entity " + std::to_string(entity_.id()) +
                                  " cannot be parented under itself or a descendant",
                              entity_);
    }
    return EditorResult<void>::ok();
}

void ReparentEntityCommand::Apply(ecs::Registry& registry) {
    oldParent_ = registry.GetParent(entity_);
    oldIndex_ = registry.GetChildIndex(entity_);
    if (registry.SetParent(entity_, newParent_, newIndex_)) {
        markTransformDirty(registry, entity_);
    }
}

void ReparentEntityCommand::Revert(ecs::Registry& registry) {
    if (registry.SetParent(entity_, oldParent_, oldIndex_)) {
        markTransformDirty(registry, entity_);
    }
}

} // namespace sedit::command
