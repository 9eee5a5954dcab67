#pragma once

/// @file result.hpp
/// @brief Result<T,E>: explicit success-or-error return type.

#include <string>
#include <utility>
#include <variant>

namespace nrt {

/// Minimal error payload used when no richer error type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a success value or an error.
///
/// Engine, store and command operations that can fail return a Result
/// instead of throwing, so normal narrative outcomes (missing node,
/// rejected command) never unwind the stack.
///
/// Example:
/// @code
///   auto loaded = config.get<int>("engine.command_history_limit");
///   if (loaded) {
///       limit = loaded.value();
///   } else {
///       NRT_LOG_WARN(LogCategory::Core, loaded.error().message());
///   }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(ErrorTag{}, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Success value (undefined behaviour on error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Error value (undefined behaviour on success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    struct ErrorTag {};

    explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> data_;
};

/// Specialisation for operations with no success value.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace nrt
