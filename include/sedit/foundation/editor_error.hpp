#pragma once

/// @file editor_error.hpp
/// @brief Error payload carried by EditorResult.

#include <string>
#include <string_view>
#include <utility>

#include "sedit/ecs/entity.hpp"
#include "sedit/foundation/error_code.hpp"

namespace sedit::foundation {

/// Error code plus a human-readable message.
///
/// Command validation also records the entity it rejected, so callers
/// can select or highlight it without parsing the message.  Errors that
/// are not about an entity (config, scene I/O) leave it null.
class EditorError {
public:
    EditorError() = default;

    EditorError(ErrorCode code, std::string message, ecs::Entity entity = ecs::kNullEntity)
        : code_(code), message_(std::move(message)), entity_(entity) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Entity the error refers to; kNullEntity when none (or the root).
    [[nodiscard]] ecs::Entity entity() const noexcept { return entity_; }

    /// "<subsystem>: <message>", the form used in logs and on stderr.
    [[nodiscard]] std::string describe() const {
        return std::string(subsystem()) + ": " + message_;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    ecs::Entity entity_;
};

} // namespace sedit::foundation
