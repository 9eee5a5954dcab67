#pragma once

/// @file value.hpp
/// @brief Dynamic scalar values used by attributes, action parameters and
/// condition operands, with one shared set of coercion rules.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace nrt::story {

/// Scalar value: absent, boolean, number or string.
///
/// std::monostate is the "absent" value (an unset attribute, a missing
/// parameter). Coercions follow script-style rules so story authors get the
/// same result from a legacy expression and from a structured condition.
using Value = std::variant<std::monostate, bool, double, std::string>;

/// Named parameters of an action or condition node.
using Params = std::map<std::string, Value, std::less<>>;

/// Comparison operators shared by every condition form.
enum class CompareOp : uint8_t {
    Equal,
    NotEqual,
    Greater,
    GreaterEqual,
    Less,
    LessEqual,
    Contains
};

[[nodiscard]] inline bool isAbsent(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

/// Numeric cast: absent and unparsable strings give NaN, the empty string
/// gives 0, booleans give 0/1.
[[nodiscard]] double toNumber(const Value& v);

/// Truthiness: absent, false, 0, NaN and "" are false.
[[nodiscard]] bool toBool(const Value& v);

/// @p n truncated toward zero and saturated to the int32 range; NaN gives 0.
[[nodiscard]] int32_t saturateToInt32(double n) noexcept;

/// Text form; integral numbers print without a fraction ("3", not "3.0").
[[nodiscard]] std::string toString(const Value& v);

/// Loose equality: numbers and numeric strings compare by value, booleans
/// compare as 0/1, absent only equals absent.
[[nodiscard]] bool looseEquals(const Value& left, const Value& right);

/// Apply @p op to two values using the coercions above.
[[nodiscard]] bool compareValues(const Value& left, const Value& right, CompareOp op);

/// Parse "==", "!=", ">", ">=", "<", "<=" or "contains".
[[nodiscard]] std::optional<CompareOp> parseCompareOp(std::string_view symbol);

[[nodiscard]] std::string_view compareOpSymbol(CompareOp op);

/// Interpret a literal written in an expression: true/false, a number,
/// a quoted string (quotes stripped) or bare text.
[[nodiscard]] Value parseLiteral(std::string_view text);

// -- Params helpers -----------------------------------------------------------

/// Pointer to the parameter, or nullptr when missing.
[[nodiscard]] const Value* findParam(const Params& params, std::string_view key);

/// Text form of a parameter; empty when missing or absent.
[[nodiscard]] std::string paramText(const Params& params, std::string_view key);

/// Numeric parameter; @p fallback when missing, absent or not a number.
[[nodiscard]] double paramNumber(const Params& params, std::string_view key, double fallback);

} // namespace nrt::story
