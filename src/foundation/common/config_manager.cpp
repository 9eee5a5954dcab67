#include "nrt/foundation/config_manager.hpp"

#include <set>

namespace nrt::foundation {

StoryResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceWith(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

StoryResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return replaceWith(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

StoryResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsDefined() && !root.IsNull()) {
        flatten("", root);
    }
    return StoryResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head = std::string(prefix) + ".";
    std::set<std::string> names;
    for (const auto& [key, node] : entries_) {
        if (key.rfind(head, 0) != 0) {
            continue;
        }
        auto rest = key.substr(head.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
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

}  // namespace nrt::foundation
