/// @file engine_config.cpp
/// @brief EngineConfig loading.

#include "nrt/engine/engine_config.hpp"

#include <string>

#include "nrt/foundation/config_manager.hpp"

namespace nrt::engine {

using foundation::LogCategory;

namespace {

template <typename T>
T readOr(const foundation::ConfigManager& config, std::string_view key, T fallback) {
    if (!config.hasKey(key)) {
        return fallback;
    }
    auto result = config.get<T>(key);
    if (!result) {
        NRT_LOG_WARN(LogCategory::Core, std::string(result.error().message()) +
                                            ", using default");
        return fallback;
    }
    return result.value();
}

} // namespace

EngineConfig EngineConfig::fromConfig(const foundation::ConfigManager& config) {
    EngineConfig cfg;

    auto history = readOr<int>(config, "engine.command_history_limit",
                               static_cast<int>(cfg.commandHistoryLimit));
    if (history > 0) {
        cfg.commandHistoryLimit = static_cast<std::size_t>(history);
    } else {
        NRT_LOG_WARN(LogCategory::Core, "engine.command_history_limit must be positive");
    }

    auto depth = readOr<int>(config, "engine.max_resolution_depth",
                             static_cast<int>(cfg.maxResolutionDepth));
    if (depth > 0) {
        cfg.maxResolutionDepth = static_cast<std::size_t>(depth);
    } else {
        NRT_LOG_WARN(LogCategory::Core, "engine.max_resolution_depth must be positive");
    }

    cfg.deadEndToast = readOr<bool>(config, "engine.dead_end_toast", cfg.deadEndToast);

    auto toastMs = readOr<int>(config, "engine.toast_duration_ms",
                               static_cast<int>(cfg.toastDuration.count()));
    if (toastMs >= 0) {
        cfg.toastDuration = std::chrono::milliseconds(toastMs);
    }

    for (const auto& name : config.childKeys("logging")) {
        auto category = foundation::parseLogCategory(name);
        if (!category) {
            NRT_LOG_WARN(LogCategory::Core, "Unknown log category in config: " + name);
            continue;
        }
        auto levelName = readOr<std::string>(config, "logging." + name, std::string{});
        auto level = foundation::parseLogLevel(levelName);
        if (!level) {
            NRT_LOG_WARN(LogCategory::Core,
                         "Unknown log level '" + levelName + "' for category " + name);
            continue;
        }
        cfg.logLevels[static_cast<std::size_t>(*category)] = level;
    }

    return cfg;
}

void EngineConfig::applyLogLevels(foundation::RuntimeLogger& logger) const {
    for (std::size_t i = 0; i < logLevels.size(); ++i) {
        if (logLevels[i]) {
            logger.setCategoryLevel(static_cast<LogCategory>(i), *logLevels[i]);
        }
    }
}

} // namespace nrt::engine
