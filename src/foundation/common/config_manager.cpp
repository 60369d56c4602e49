/// @file config_manager.cpp
/// @brief YAML-backed ConfigManager implementation.

#include "gec/foundation/config_manager.hpp"

#include "gec/foundation/game_logger.hpp"

namespace gec::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto result = replaceWith(YAML::LoadFile(path.string()));
        if (result) {
            GEC_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
        }
        return result;
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> ConfigManager::loadFromString(std::string_view document) {
    try {
        return replaceWith(YAML::Load(std::string(document)));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "configuration root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return GameResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    // Callbacks run outside the lock so they may read the new value.
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace gec::foundation
