#pragma once

/// @file runtime_logger.hpp
/// @brief RuntimeLogger wrapping the kcenon logger registry for
/// category-filtered runtime diagnostics.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "nrt/foundation/story_result.hpp"

namespace nrt::foundation {

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

/// Runtime subsystems, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Configuration, factory, process-level messages
    Events    = 1, ///< Event bus dispatch
    State     = 2, ///< Attribute / inventory / clue store
    Action    = 3, ///< Action registry and executor
    Condition = 4, ///< Condition registry and engine
    Scene     = 5, ///< Scene graph bookkeeping
    Engine    = 6, ///< Narrative engine navigation
    Command   = 7  ///< Undo/redo command bus
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Events", "State", "Action", "Condition", "Scene", "Engine", "Command"
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

/// Parse a lower-case level name ("trace" .. "off") as used in config files.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name as printed by logCategoryName(), case-insensitive.
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Narrative identifiers attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.segmentId = "seg_intro";
///   ctx.nodeId = "node_gate";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Engine,
///                         "No viable edge", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> segmentId;
    std::optional<std::string> nodeId;
    std::optional<std::string> actionType;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Default minimum levels:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Events    | Info          |
/// | State     | Debug         |
/// | Action    | Debug         |
/// | Condition | Info          |
/// | Scene     | Info          |
/// | Engine    | Debug         |
/// | Command   | Info          |
class RuntimeLogger {
public:
    RuntimeLogger();
    ~RuntimeLogger();

    RuntimeLogger(const RuntimeLogger&) = delete;
    RuntimeLogger& operator=(const RuntimeLogger&) = delete;
    RuntimeLogger(RuntimeLogger&&) noexcept;
    RuntimeLogger& operator=(RuntimeLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with narrative context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default backend logger.
    StoryResult<void> flush();

    /// Process-wide instance used by the NRT_LOG macros.
    static RuntimeLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nrt::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// NRT_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef NRT_MIN_LOG_LEVEL
    #define NRT_MIN_LOG_LEVEL 0
#endif

#define NRT_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= NRT_MIN_LOG_LEVEL &&                         \
            ::nrt::foundation::RuntimeLogger::instance().isEnabled((level), (cat))) \
        {                                                                           \
            ::nrt::foundation::RuntimeLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define NRT_LOG_DEBUG(cat, msg) \
    NRT_LOG(::nrt::foundation::LogLevel::Debug, (cat), (msg))

#define NRT_LOG_INFO(cat, msg) \
    NRT_LOG(::nrt::foundation::LogLevel::Info, (cat), (msg))

#define NRT_LOG_WARN(cat, msg) \
    NRT_LOG(::nrt::foundation::LogLevel::Warning, (cat), (msg))

#define NRT_LOG_ERROR(cat, msg) \
    NRT_LOG(::nrt::foundation::LogLevel::Error, (cat), (msg))
