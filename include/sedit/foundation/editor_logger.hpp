#pragma once

/// @file editor_logger.hpp
/// @brief EditorLogger wrapping kcenon logger interfaces for categorized logging.
///
/// Provides per-category level filtering and structured context on top of
/// whatever ILogger is installed in kcenon's GlobalLoggerRegistry.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "sedit/foundation/editor_result.hpp"

namespace sedit::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Editor subsystems with independently adjustable verbosity.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Editor lifecycle
    ECS     = 1, ///< Registry and component storage
    Command = 2, ///< Command execution, undo and redo
    Scene   = 3, ///< Scene persistence and transform propagation
    Config  = 4  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Command", "Scene", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a case-insensitive level name ("debug", "WARNING", "warn", ...).
/// @return std::nullopt for unrecognised names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a case-insensitive category name ("ecs", "Command", ...).
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured data appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = 12;
///   ctx.command = "Delete Node";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Command, "undo", ctx);
///   // -> "[Command] undo {entity_id=12, command=Delete Node}"
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<std::string> command;
    std::map<std::string, std::string> extra;
};

/// Category-aware logger in front of the kcenon logging interfaces.
///
/// Default levels:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Debug         |
/// | Command  | Debug         |
/// | Scene    | Info          |
/// | Config   | Info          |
///
/// Each category first looks up a logger named "sedit.<Category>" in the
/// GlobalLoggerRegistry and falls back to the registry's default logger.
class EditorLogger {
public:
    EditorLogger();
    ~EditorLogger();

    EditorLogger(const EditorLogger&) = delete;
    EditorLogger& operator=(const EditorLogger&) = delete;
    EditorLogger(EditorLogger&&) noexcept;
    EditorLogger& operator=(EditorLogger&&) noexcept;

    /// Log a message; no-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    EditorResult<void> flush();

    /// Process-wide logger used by the SEDIT_LOG macros.
    static EditorLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sedit::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// SEDIT_MIN_LOG_LEVEL may be defined before including this header to strip
/// calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef SEDIT_MIN_LOG_LEVEL
    #define SEDIT_MIN_LOG_LEVEL 0
#endif

#define SEDIT_LOG(level, cat, msg)                                                  \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= SEDIT_MIN_LOG_LEVEL &&                       \
            ::sedit::foundation::EditorLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::sedit::foundation::EditorLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define SEDIT_LOG_DEBUG(cat, msg) \
    SEDIT_LOG(::sedit::foundation::LogLevel::Debug, (cat), (msg))

#define SEDIT_LOG_INFO(cat, msg) \
    SEDIT_LOG(::sedit::foundation::LogLevel::Info, (cat), (msg))

#define SEDIT_LOG_WARN(cat, msg) \
    SEDIT_LOG(::sedit::foundation::LogLevel::Warning, (cat), (msg))

#define SEDIT_LOG_ERROR(cat, msg) \
    SEDIT_LOG(::sedit::foundation::LogLevel::Error, (cat), (msg))
