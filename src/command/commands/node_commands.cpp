/// @file node_commands.cpp
/// @brief Commands that create or destroy nodes: add, delete, duplicate.

#include "sedit/command/commands.hpp"

#include "command_checks.hpp"
#include "sedit/foundation/editor_logger.hpp"

namespace sedit::command {

using foundation::EditorResult;
using foundation::LogCategory;

// ═══════════════════════════════════════════════════════════════════════════
// AddNodeCommand
// ═══════════════════════════════════════════════════════════════════════════

AddNodeCommand::AddNodeCommand(std::string name, ecs::Entity parent, scene::Transform transform)
    : name_(std::move(name)), parent_(parent), transform_(std::move(transform)) {}

EditorResult<void> AddNodeCommand::Validate(const ecs::Registry& registry) const {
    return detail::requireParent(registry, Name(), parent_);
}

void AddNodeCommand::Apply(ecs::Registry& registry) {
    // After a Revert, bring the node back under the id it had.
    ecs::Entity entity = registry.CreateEntity(created_, name_);
    created_ = entity.isValid() ? entity : registry.CreateEntity(name_);
    auto* transform = registry.AddComponent<scene::Transform>(created_, transform_);
    transform->dirty = true;
    if (parent_.isValid()) {
        registry.SetParent(created_, parent_);
    }
}

void AddNodeCommand::Revert(ecs::Registry& registry) {
    if (!created_.isValid()) {
        return;
    }
    registry.DestroyEntity(created_);
}

// ═══════════════════════════════════════════════════════════════════════════
// DeleteNodeCommand
// ═══════════════════════════════════════════════════════════════════════════

DeleteNodeCommand::DeleteNodeCommand(ecs::Entity target) : target_(target) {}

EditorResult<void> DeleteNodeCommand::Validate(const ecs::Registry& registry) const {
    return detail::requireEditable(registry, Name(), target_);
}

void DeleteNodeCommand::Apply(ecs::Registry& registry) {
    snapshot_ = scene::CaptureSnapshot(registry, target_);
    if (!snapshot_) {
        return;
    }
    parent_ = registry.GetParent(target_);
    index_ = registry.GetChildIndex(target_);
    registry.DestroyEntity(target_);
}

void DeleteNodeCommand::Revert(ecs::Registry& registry) {
    if (!snapshot_) {
        return;
    }
    auto restored =
        scene::RestoreSnapshot(registry, *snapshot_, parent_, index_, scene::RestoreIds::Original);
    if (!restored.isValid()) {
        SEDIT_LOG_WARN(LogCategory::Command,
                       "parent " + std::to_string(parent_.id()) +
                           " is gone; restoring deleted node at the top level");
        parent_ = ecs::kNullEntity;
        index_ = ecs::Registry::kAppend;
        restored = scene::RestoreSnapshot(registry, *snapshot_, parent_, index_,
                                          scene::RestoreIds::Original);
    }
    target_ = restored;
}

// ═══════════════════════════════════════════════════════════════════════════
// DuplicateNodeCommand
// ═══════════════════════════════════════════════════════════════════════════

DuplicateNodeCommand::DuplicateNodeCommand(ecs::Entity source, std::string suffix)
    : source_(source), suffix_(std::move(suffix)) {}

EditorResult<void> DuplicateNodeCommand::Validate(const ecs::Registry& registry) const {
    return detail::requireEditable(registry, Name(), source_);
}

void DuplicateNodeCommand::Apply(ecs::Registry& registry) {
    const auto* record = registry.GetRecord(source_);
    if (record == nullptr) {
        return;
    }

    duplicate_ = registry.CreateEntity(record->name + suffix_);
    registry.CopyComponents(source_, duplicate_);
    registry.SetActive(duplicate_, record->active);
    for (const auto& tag : record->tags) {
        registry.AddTag(duplicate_, tag);
    }
    if (auto* transform = registry.GetComponent<scene::Transform>(duplicate_)) {
        transform->dirty = true;
    }

    registry.SetParent(duplicate_, record->parent, registry.GetChildIndex(source_) + 1);

    // Descendants keep their own names.
    for (ecs::Entity child : registry.GetChildren(source_)) {
        if (auto snapshot = scene::CaptureSnapshot(registry, child)) {
            scene::RestoreSnapshot(registry, *snapshot, duplicate_);
        }
    }
}

void DuplicateNodeCommand::Revert(ecs::Registry& registry) {
    if (!duplicate_.isValid()) {
        return;
    }
    copy_ = scene::CaptureSnapshot(registry, duplicate_);
    copyParent_ = registry.GetParent(duplicate_);
    copyIndex_ = registry.GetChildIndex(duplicate_);
    registry.DestroyEntity(duplicate_);
}

void DuplicateNodeCommand::Reapply(ecs::Registry& registry) {
    if (copy_) {
        auto restored = scene::RestoreSnapshot(registry, *copy_, copyParent_, copyIndex_,
                                               scene::RestoreIds::Original);
        if (restored.isValid()) {
            duplicate_ = restored;
            return;
        }
    }
    Apply(registry);
}

} // namespace sedit::command
