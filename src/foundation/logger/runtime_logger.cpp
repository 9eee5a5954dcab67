/// @file runtime_logger.cpp
/// @brief RuntimeLogger implementation over the kcenon logger registry.

#include "nrt/foundation/runtime_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace nrt::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Events
    LogLevel::Debug,  // State
    LogLevel::Debug,  // Action
    LogLevel::Info,   // Condition
    LogLevel::Info,   // Scene
    LogLevel::Debug,  // Engine
    LogLevel::Info    // Command
};

static std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    auto key = lowercase(name);
    if (key == "trace") { return LogLevel::Trace; }
    if (key == "debug") { return LogLevel::Debug; }
    if (key == "info") { return LogLevel::Info; }
    if (key == "warning" || key == "warn") { return LogLevel::Warning; }
    if (key == "error") { return LogLevel::Error; }
    if (key == "critical") { return LogLevel::Critical; }
    if (key == "off") { return LogLevel::Off; }
    return std::nullopt;
}

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    auto key = lowercase(name);
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        if (lowercase(logCategoryName(cat)) == key) {
            return cat;
        }
    }
    return std::nullopt;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.segmentId && !ctx.segmentId->empty()) {
        append("segment", *ctx.segmentId);
    }
    if (ctx.nodeId && !ctx.nodeId->empty()) {
        append("node", *ctx.nodeId);
    }
    if (ctx.actionType && !ctx.actionType->empty()) {
        append("action", *ctx.actionType);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct RuntimeLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("nrt.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named per-category logger if registered, otherwise the default one.
    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               std::string_view ctxStr) const {
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        // Backend write failures are not reported to callers.
        static_cast<void>(getLogger(cat)->log(mapLevel(level), formatted));
    }
};

RuntimeLogger::RuntimeLogger() : impl_(std::make_unique<Impl>()) {}

RuntimeLogger::~RuntimeLogger() = default;

RuntimeLogger::RuntimeLogger(RuntimeLogger&&) noexcept = default;
RuntimeLogger& RuntimeLogger::operator=(RuntimeLogger&&) noexcept = default;

void RuntimeLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void RuntimeLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

void RuntimeLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel RuntimeLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool RuntimeLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

StoryResult<void> RuntimeLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return StoryResult<void>::ok();
}

RuntimeLogger& RuntimeLogger::instance() {
    static RuntimeLogger inst;
    return inst;
}

} // namespace nrt::foundation
