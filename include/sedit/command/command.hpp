#pragma once

/// @file command.hpp
/// @brief Reversible editor operations.
///
/// Every structural or property edit is an ICommand handed to the
/// CommandManager.  A command owns only its private payload (names,
/// snapshots, old/new values, entity ids) and resolves entities through
/// the registry passed to each call; it never keeps pointers into
/// registry storage.  Destroying the command releases the payload.

#include "sedit/ecs/entity.hpp"
#include "sedit/ecs/registry.hpp"
#include "sedit/foundation/editor_result.hpp"

#include <memory>
#include <string_view>

namespace sedit::command {

class ICommand {
public:
    virtual ~ICommand() = default;

    /// Short human-readable label, e.g. "Delete Node".
    [[nodiscard]] virtual std::string_view Name() const = 0;

    /// Entity the command acts on (the created one for creating commands).
    [[nodiscard]] virtual ecs::Entity Target() const = 0;

    /// Check the payload against the registry before the first Apply.
    ///
    /// This is the only validation point: once a command has been
    /// applied it is assumed well-formed for its whole stack lifetime.
    [[nodiscard]] virtual foundation::EditorResult<void> Validate(
        const ecs::Registry& registry) const = 0;

    /// Perform the forward effect, recording whatever Revert needs.
    virtual void Apply(ecs::Registry& registry) = 0;

    /// Undo the effect recorded by the last Apply / Reapply.
    virtual void Revert(ecs::Registry& registry) = 0;

    /// Redo after a Revert.  Defaults to Apply; commands whose Revert
    /// re-creates entities re-resolve the new ids here.
    virtual void Reapply(ecs::Registry& registry) { Apply(registry); }

    /// Independent deep copy of the command and its payload.
    [[nodiscard]] virtual std::unique_ptr<ICommand> Clone() const = 0;
};

/// Implements Clone() for a copyable concrete command.
template <typename Derived>
class CommandBase : public ICommand {
public:
    [[nodiscard]] std::unique_ptr<ICommand> Clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

} // namespace sedit::command
