#pragma once

/// @file command_manager.hpp
/// @brief Bounded undo/redo history driving ICommand objects.

#include "sedit/command/command.hpp"
#include "sedit/ecs/registry.hpp"
#include "sedit/foundation/editor_result.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string_view>
#include <vector>

namespace sedit::command {

/// Undo/redo stacks over one registry.
///
/// Transition rules:
/// - Execute: validate; on success clear the redo stack, Apply, push onto
///   the undo stack and evict the oldest entry beyond MaxDepth().
///   Rejected commands are logged, destroyed and touch no stack.
/// - Undo: pop the newest command, Revert it, push a Clone() of the
///   reverted command onto the redo stack, release the original.
/// - Redo: mirror image using Reapply.
///
/// The clone is taken after Revert / Reapply so that ids the command
/// learned during the transition (a re-created entity, for example)
/// travel with it to the other stack.
///
/// Example:
/// @code
///   CommandManager history(registry);
///   history.Execute(std::make_unique<AddNodeCommand>("Cube", kNullEntity));
///   history.Undo();   // cube destroyed
///   history.Redo();   // cube re-created under a new id
/// @endcode
class CommandManager {
public:
    static constexpr std::size_t kDefaultMaxDepth = 100;

    /// The registry must outlive the manager.
    explicit CommandManager(ecs::Registry& registry, std::size_t maxDepth = kDefaultMaxDepth);

    CommandManager(const CommandManager&) = delete;
    CommandManager& operator=(const CommandManager&) = delete;

    /// Validate and apply @p command, then record it for undo.
    /// @return The command's Target() after Apply, or NullCommand / the
    ///         command's validation error on rejection.
    foundation::EditorResult<ecs::Entity> Execute(std::unique_ptr<ICommand> command);

    /// Revert the newest command.  @return false when there is nothing to undo.
    bool Undo();

    /// Reapply the newest undone command.  @return false when there is nothing to redo.
    bool Redo();

    /// Release every command on both stacks.
    void Clear();

    [[nodiscard]] bool CanUndo() const noexcept { return !undoStack_.empty(); }
    [[nodiscard]] bool CanRedo() const noexcept { return !redoStack_.empty(); }

    [[nodiscard]] std::size_t UndoCount() const noexcept { return undoStack_.size(); }
    [[nodiscard]] std::size_t RedoCount() const noexcept { return redoStack_.size(); }

    [[nodiscard]] std::size_t MaxDepth() const noexcept { return maxDepth_; }

    /// Change the undo bound, evicting the oldest entries if needed.
    void SetMaxDepth(std::size_t maxDepth);

    /// Label of the command Undo() / Redo() would run; empty if none.
    [[nodiscard]] std::string_view UndoName() const;
    [[nodiscard]] std::string_view RedoName() const;

    /// Undo history from oldest to newest, for history panels.
    [[nodiscard]] std::vector<std::string_view> UndoHistory() const;

private:
    void enforceDepth();

    ecs::Registry& registry_;
    std::deque<std::unique_ptr<ICommand>> undoStack_;   ///< front = oldest, back = newest.
    std::vector<std::unique_ptr<ICommand>> redoStack_;  ///< back = next to redo.
    std::size_t maxDepth_;
};

} // namespace sedit::command
