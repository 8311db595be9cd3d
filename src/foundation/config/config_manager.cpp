/// @file config_manager.cpp
/// @brief YAML-backed ConfigManager: load, flatten, watch.

#include "sedit/foundation/config_manager.hpp"

#include "sedit/foundation/editor_logger.hpp"

namespace sedit::foundation {

EditorResult<void> ConfigManager::load(const std::filesystem::path& path) {
    Entries loaded;
    try {
        flatten("", YAML::LoadFile(path.string()), loaded);
    } catch (const YAML::BadFile&) {
        return EditorResult<void>::err(ErrorCode::ConfigLoadFailed,
                                       "failed to open config file: " + path.string());
    } catch (const YAML::Exception& e) {
        return EditorResult<void>::err(ErrorCode::ConfigLoadFailed,
                                       std::string("YAML error: ") + e.what());
    }

    {
        std::lock_guard lock(mutex_);
        entries_.swap(loaded);
    }
    SEDIT_LOG_INFO(LogCategory::Config, "loaded " + path.string());
    return EditorResult<void>::ok();
}

EditorResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    Entries loaded;
    try {
        flatten("", YAML::Load(std::string(yaml)), loaded);
    } catch (const YAML::Exception& e) {
        return EditorResult<void>::err(ErrorCode::ConfigLoadFailed,
                                       std::string("YAML error: ") + e.what());
    }

    std::lock_guard lock(mutex_);
    entries_.swap(loaded);
    return EditorResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head = std::string(prefix) + ".";
    std::vector<std::string> keys;
    for (const auto& [key, node] : entries_) {
        if (key.compare(0, head.size(), head) == 0) {
            keys.push_back(key);
        }
    }
    return keys;
}

// Map keys must be scalars; anything else throws YAML::BadConversion.
void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node, Entries& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else if (!prefix.empty()) {
        out[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    // Callbacks run without the lock held so they may read the new value.
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

} // namespace sedit::foundation
