#pragma once

/// @file engine_config.hpp
/// @brief Tunables of the narrative runtime, read from ConfigManager.

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::foundation {
class ConfigManager;
}

namespace nrt::engine {

/// Runtime settings.
///
/// | Key                           | Default |
/// |-------------------------------|---------|
/// | engine.command_history_limit  | 50      |
/// | engine.max_resolution_depth   | 64      |
/// | engine.dead_end_toast         | true    |
/// | engine.toast_duration_ms      | 2000    |
/// | logging.<category>            | unset   |
struct EngineConfig {
    std::size_t commandHistoryLimit = 50;
    std::size_t maxResolutionDepth = 64;
    bool deadEndToast = true;
    std::chrono::milliseconds toastDuration{2000};
    std::array<std::optional<foundation::LogLevel>, foundation::kLogCategoryCount> logLevels{};

    /// Read every key above, keeping defaults for missing or mistyped
    /// entries (each logged as a warning).
    static EngineConfig fromConfig(const foundation::ConfigManager& config);

    /// Push the configured category levels into @p logger.
    void applyLogLevels(foundation::RuntimeLogger& logger) const;
};

} // namespace nrt::engine
