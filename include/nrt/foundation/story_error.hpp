#pragma once

/// @file story_error.hpp
/// @brief Error type carried by StoryResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "nrt/foundation/error_code.hpp"

namespace nrt::foundation {

/// Error with a categorized code, a readable message and optional
/// type-erased context (for example the node id that failed).
class StoryError {
public:
    StoryError() = default;

    explicit StoryError(ErrorCode code)
        : code_(code) {}

    StoryError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    StoryError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch or when absent.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace nrt::foundation
