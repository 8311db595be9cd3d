#pragma once

/// @file command_checks.hpp
/// @brief Validation helpers shared by the concrete commands.

#include "sedit/ecs/registry.hpp"
#include "sedit/foundation/editor_result.hpp"

#include <string>
#include <string_view>

namespace sedit::command::detail {

inline foundation::EditorResult<void> reject(foundation::ErrorCode code, std::string_view command,
                                             const std::string& what, ecs::Entity entity) {
    return foundation::EditorResult<void>::err(foundation::EditorError(
        code, std::string(command) + ": " + what, entity));
}

/// The entity must be alive and must not be the scene root.
inline foundation::EditorResult<void> requireEditable(const ecs::Registry& registry,
                                                      std::string_view command,
                                                      ecs::Entity entity) {
    if (!entity.isValid()) {
        return reject(foundation::ErrorCode::RootEntityProtected, command,
                      "the scene root cannot be modified", entity);
    }
    if (!registry.IsAlive(entity)) {
        return reject(foundation::ErrorCode::EntityNotFound, command,
                      "no entity " + std::to_string(entity.id()), entity);
    }
    return foundation::EditorResult<void>::ok();
}

/// The entity must be the root or alive.
inline foundation::EditorResult<void> requireParent(const ecs::Registry& registry,
                                                    std::string_view command,
                                                    ecs::Entity parent) {
    if (parent.isValid() && !registry.IsAlive(parent)) {
        return reject(foundation::ErrorCode::EntityNotFound, command,
                      "no parent entity " + std::to_string(parent.id()), parent);
    }
    return foundation::EditorResult<void>::ok();
}

} // namespace sedit::command::detail
