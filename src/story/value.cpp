/// @file value.cpp
/// @brief Coercion and comparison rules for story values.

#include "nrt/story/value.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace nrt::story {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::string_view trim(std::string_view text) {
    const auto* ws = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

double parseNumber(std::string_view text) {
    auto body = trim(text);
    if (body.empty()) {
        return 0.0;
    }
    if (body == "Infinity" || body == "+Infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (body == "-Infinity") {
        return -std::numeric_limits<double>::infinity();
    }
    // from_chars rejects a leading '+', scripts accept it.
    if (body.front() == '+') {
        body.remove_prefix(1);
        if (body.empty() || body.front() == '-') {
            return kNaN;
        }
    }
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), out);
    if (ec != std::errc() || ptr != body.data() + body.size()) {
        return kNaN;
    }
    return out;
}

std::string formatNumber(double n) {
    if (std::isnan(n)) {
        return "NaN";
    }
    if (std::isinf(n)) {
        return n > 0 ? "Infinity" : "-Infinity";
    }
    if (n == 0.0) {
        return "0";
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n);
    if (ec != std::errc()) {
        return std::to_string(n);
    }
    return std::string(buf, ptr);
}

} // namespace

int32_t saturateToInt32(double n) noexcept {
    if (std::isnan(n)) {
        return 0;
    }
    if (n >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    if (n <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    return static_cast<int32_t>(n);
}

double toNumber(const Value& v) {
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b ? 1.0 : 0.0;
    }
    if (const auto* d = std::get_if<double>(&v)) {
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        return parseNumber(*s);
    }
    return kNaN;
}

bool toBool(const Value& v) {
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b;
    }
    if (const auto* d = std::get_if<double>(&v)) {
        return *d != 0.0 && !std::isnan(*d);
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        return !s->empty();
    }
    return false;
}

std::string toString(const Value& v) {
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b ? "true" : "false";
    }
    if (const auto* d = std::get_if<double>(&v)) {
        return formatNumber(*d);
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    return "undefined";
}

bool looseEquals(const Value& left, const Value& right) {
    if (isAbsent(left) || isAbsent(right)) {
        return isAbsent(left) && isAbsent(right);
    }
    if (left.index() == right.index()) {
        if (std::holds_alternative<double>(left)) {
            return std::get<double>(left) == std::get<double>(right);
        }
        return left == right;
    }
    // Mixed kinds: booleans and strings fall back to numeric comparison.
    return toNumber(left) == toNumber(right);
}

bool compareValues(const Value& left, const Value& right, CompareOp op) {
    switch (op) {
        case CompareOp::Equal:        return looseEquals(left, right);
        case CompareOp::NotEqual:     return !looseEquals(left, right);
        case CompareOp::Greater:      return toNumber(left) > toNumber(right);
        case CompareOp::GreaterEqual: return toNumber(left) >= toNumber(right);
        case CompareOp::Less:         return toNumber(left) < toNumber(right);
        case CompareOp::LessEqual:    return toNumber(left) <= toNumber(right);
        case CompareOp::Contains:
            return toString(left).find(toString(right)) != std::string::npos;
    }
    return false;
}

std::optional<CompareOp> parseCompareOp(std::string_view symbol) {
    if (symbol == "==") { return CompareOp::Equal; }
    if (symbol == "!=") { return CompareOp::NotEqual; }
    if (symbol == ">") { return CompareOp::Greater; }
    if (symbol == ">=") { return CompareOp::GreaterEqual; }
    if (symbol == "<") { return CompareOp::Less; }
    if (symbol == "<=") { return CompareOp::LessEqual; }
    if (symbol == "contains") { return CompareOp::Contains; }
    return std::nullopt;
}

std::string_view compareOpSymbol(CompareOp op) {
    switch (op) {
        case CompareOp::Equal:        return "==";
        case CompareOp::NotEqual:     return "!=";
        case CompareOp::Greater:      return ">";
        case CompareOp::GreaterEqual: return ">=";
        case CompareOp::Less:         return "<";
        case CompareOp::LessEqual:    return "<=";
        case CompareOp::Contains:     return "contains";
    }
    return "?";
}

Value parseLiteral(std::string_view text) {
    auto body = trim(text);
    if (body == "true") {
        return true;
    }
    if (body == "false") {
        return false;
    }
    if (!body.empty()) {
        double n = parseNumber(body);
        if (!std::isnan(n)) {
            return n;
        }
        if (body.front() == '\'' || body.front() == '"') {
            auto inner = body.substr(1);
            if (!inner.empty() && inner.back() == body.front()) {
                inner.remove_suffix(1);
            }
            return std::string(inner);
        }
    }
    return std::string(body);
}

const Value* findParam(const Params& params, std::string_view key) {
    auto it = params.find(key);
    return it == params.end() ? nullptr : &it->second;
}

std::string paramText(const Params& params, std::string_view key) {
    const auto* v = findParam(params, key);
    if (v == nullptr || isAbsent(*v)) {
        return {};
    }
    return toString(*v);
}

double paramNumber(const Params& params, std::string_view key, double fallback) {
    const auto* v = findParam(params, key);
    if (v == nullptr || isAbsent(*v)) {
        return fallback;
    }
    double n = toNumber(*v);
    return std::isnan(n) ? fallback : n;
}

} // namespace nrt::story
