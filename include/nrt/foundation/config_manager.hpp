#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed runtime configuration with typed, dotted-key access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "nrt/foundation/story_result.hpp"

namespace nrt::foundation {

/// Callback invoked when a watched key is changed through set().
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Configuration store loaded from YAML.
///
/// The YAML tree is flattened into dotted keys ("engine.command_history_limit")
/// at load time so lookups never walk yaml-cpp nodes by reference.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing previous entries.
    /// @return Success or ConfigLoadFailed.
    StoryResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    StoryResult<void> loadString(std::string_view yaml);

    /// Typed lookup by dotted key.
    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    StoryResult<T> get(std::string_view key) const;

    /// Typed lookup that falls back to @p fallback on any error.
    template <typename T>
    T getOr(std::string_view key, T fallback) const {
        auto result = get<T>(key);
        return result ? std::move(result).value() : std::move(fallback);
    }

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Keys directly below @p prefix ("logging" -> {"engine", "state"}).
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    StoryResult<void> replaceWith(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

template <typename T>
StoryResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return StoryResult<T>::err(
            StoryError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return StoryResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return StoryResult<T>::err(
            StoryError(ErrorCode::ConfigTypeMismatch,
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

} // namespace nrt::foundation
