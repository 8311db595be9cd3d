#pragma once

/// @file commands.hpp
/// @brief Concrete editor commands.
///
/// | Command         | Apply                                   | Revert                           |
/// |-----------------|-----------------------------------------|----------------------------------|
/// | AddNode         | create entity (+Transform) under parent | destroy it                       |
/// | DeleteNode      | snapshot subtree, destroy               | rebuild subtree at old position  |
/// | RenameEntity    | remember old name, set new              | restore old name                 |
/// | DuplicateNode   | deep-copy subtree next to the source    | snapshot the copy, destroy it    |
/// | ModifyTransform | remember old Transform, assign new      | reassign old Transform           |
/// | ReparentEntity  | remember parent/index, move             | move back                        |
/// | SetActive       | remember flag, set new                  | restore flag                     |

#include "sedit/command/command.hpp"
#include "sedit/scene/components.hpp"
#include "sedit/scene/entity_snapshot.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace sedit::command {

// ── Structural commands ─────────────────────────────────────────────────

/// Create a new node under @p parent (kNullEntity = scene root).
///
/// The node always receives a Transform (identity unless one is given).
/// Reapply re-creates the node under the id it was first given.
class AddNodeCommand final : public CommandBase<AddNodeCommand> {
public:
    AddNodeCommand(std::string name, ecs::Entity parent,
                   scene::Transform transform = scene::Transform{});

    [[nodiscard]] std::string_view Name() const override { return "Add Node"; }
    [[nodiscard]] ecs::Entity Target() const override { return created_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;

    [[nodiscard]] ecs::Entity Created() const noexcept { return created_; }

private:
    std::string name_;
    ecs::Entity parent_;
    scene::Transform transform_;
    ecs::Entity created_;
};

/// Delete a node together with its descendants.
///
/// Apply snapshots the subtree and its sibling position before
/// destroying it; Revert rebuilds the subtree there under the original
/// ids and Reapply deletes it again.
class DeleteNodeCommand final : public CommandBase<DeleteNodeCommand> {
public:
    explicit DeleteNodeCommand(ecs::Entity target);

    [[nodiscard]] std::string_view Name() const override { return "Delete Node"; }
    [[nodiscard]] ecs::Entity Target() const override { return target_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;

    [[nodiscard]] const std::optional<scene::EntitySnapshot>& Snapshot() const noexcept {
        return snapshot_;
    }

private:
    ecs::Entity target_;
    ecs::Entity parent_;
    std::size_t index_ = ecs::Registry::kAppend;
    std::optional<scene::EntitySnapshot> snapshot_;
};

/// Deep-copy a node and its descendants.
///
/// The copy is placed directly after the source among its siblings and
/// named `<source name><suffix>`.  Revert snapshots the copy before
/// destroying it so that Reapply brings it back with the same ids.
class DuplicateNodeCommand final : public CommandBase<DuplicateNodeCommand> {
public:
    explicit DuplicateNodeCommand(ecs::Entity source, std::string suffix = " (copy)");

    [[nodiscard]] std::string_view Name() const override { return "Duplicate Node"; }
    [[nodiscard]] ecs::Entity Target() const override { return duplicate_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;
    void Reapply(ecs::Registry& registry) override;

    [[nodiscard]] ecs::Entity Source() const noexcept { return source_; }
    [[nodiscard]] ecs::Entity Duplicate() const noexcept { return duplicate_; }

private:
    ecs::Entity source_;
    std::string suffix_;
    ecs::Entity duplicate_;
    std::optional<scene::EntitySnapshot> copy_;
    ecs::Entity copyParent_;
    std::size_t copyIndex_ = ecs::Registry::kAppend;
};

/// Move a node under another parent, optionally at a sibling position.
class ReparentEntityCommand final : public CommandBase<ReparentEntityCommand> {
public:
    ReparentEntityCommand(ecs::Entity entity, ecs::Entity newParent,
                          std::size_t index = ecs::Registry::kAppend);

    [[nodiscard]] std::string_view Name() const override { return "Reparent Entity"; }
    [[nodiscard]] ecs::Entity Target() const override { return entity_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;

private:
    ecs::Entity entity_;
    ecs::Entity newParent_;
    std::size_t newIndex_;
    ecs::Entity oldParent_;
    std::size_t oldIndex_ = ecs::Registry::kAppend;
};

// ── Property commands ───────────────────────────────────────────────────

class RenameEntityCommand final : public CommandBase<RenameEntityCommand> {
public:
    RenameEntityCommand(ecs::Entity entity, std::string newName);

    [[nodiscard]] std::string_view Name() const override { return "Rename Entity"; }
    [[nodiscard]] ecs::Entity Target() const override { return entity_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;

private:
    ecs::Entity entity_;
    std::string newName_;
    std::string oldName_;
};

/// Assign a whole Transform value.  The entity must already have one.
class ModifyTransformCommand final : public CommandBase<ModifyTransformCommand> {
public:
    ModifyTransformCommand(ecs::Entity entity, scene::Transform newValue);

    [[nodiscard]] std::string_view Name() const override { return "Modify Transform"; }
    [[nodiscard]] ecs::Entity Target() const override { return entity_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;

private:
    ecs::Entity entity_;
    scene::Transform newValue_;
    scene::Transform oldValue_;
};

class SetActiveCommand final : public CommandBase<SetActiveCommand> {
public:
    SetActiveCommand(ecs::Entity entity, bool active);

    [[nodiscard]] std::string_view Name() const override { return "Set Active"; }
    [[nodiscard]] ecs::Entity Target() const override { return entity_; }

    [[nodiscard]] foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const override;
    void Apply(ecs::Registry& registry) override;
    void Revert(ecs::Registry& registry) override;

private:
    ecs::Entity entity_;
    bool active_;
    bool wasActive_ = true;
};

} // namespace sedit::command
