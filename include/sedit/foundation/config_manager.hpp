#pragma once

/// @file config_manager.hpp
/// @brief YAML-based editor configuration with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "sedit/foundation/editor_result.hpp"

namespace sedit::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Editor settings keyed by dotted path (e.g. "editor.undo_depth").
///
/// The YAML tree is flattened into a key-value map on load so that
/// lookups never walk yaml-cpp's reference-semantic nodes.
///
/// Example config:
/// @code
///   editor:
///     undo_depth: 50
///     duplicate_suffix: " (copy)"
///   logging:
///     command: info
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    EditorResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    EditorResult<void> loadFromString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    EditorResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is absent or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const {
        auto result = get<T>(key);
        return result ? std::move(result).value() : std::move(fallback);
    }

    /// Set a value and notify watchers of @p key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback fired whenever set() changes @p key.
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Keys beginning with @p prefix followed by a dot, e.g. all "logging.*".
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

private:
    using Entries = std::unordered_map<std::string, YAML::Node>;

    static void flatten(const std::string& prefix, const YAML::Node& node, Entries& out);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    Entries entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
EditorResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EditorResult<T>::err(
            EditorError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EditorResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return EditorResult<T>::err(
            EditorError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace sedit::foundation
