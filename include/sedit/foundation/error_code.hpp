#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the scene editor core.

#include <cstdint>
#include <string_view>

namespace sedit::foundation {

/// Error codes grouped by subsystem.
///
/// Each subsystem owns a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // ECS (0x0100 - 0x01FF)
    EntityNotFound = 0x0100,
    ComponentNotFound = 0x0101,
    CyclicHierarchy = 0x0102,
    RootEntityProtected = 0x0103,

    // Command (0x0200 - 0x02FF)
    InvalidCommand = 0x0200,
    NullCommand = 0x0201,
    NothingToUndo = 0x0202,
    NothingToRedo = 0x0203,

    // Scene (0x0300 - 0x03FF)
    SceneLoadFailed = 0x0300,
    SceneSaveFailed = 0x0301,
    SceneFormatError = 0x0302,

    // Config (0x0400 - 0x04FF)
    ConfigLoadFailed = 0x0400,
    ConfigKeyNotFound = 0x0401,
    ConfigTypeMismatch = 0x0402,

    // Logger (0x0500 - 0x05FF)
    LoggerError = 0x0500,
    LoggerFlushFailed = 0x0501,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "ECS";
        case 0x0200: return "Command";
        case 0x0300: return "Scene";
        case 0x0400: return "Config";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

} // namespace sedit::foundation
