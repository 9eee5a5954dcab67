/// @file builtin_conditions.cpp
/// @brief Built-in condition handlers and operand resolution.

#include <cmath>

#include "nrt/logic/condition_registry.hpp"
#include "nrt/state/variable_store.hpp"

namespace nrt::logic {

using story::ConditionNode;
using story::paramText;
using story::Value;

story::Value ResolveOperand(const story::Operand& operand, const ConditionContext& ctx) {
    if (const auto* ref = std::get_if<story::AttributeRef>(&operand)) {
        return ctx.store.getAttribute(ref->ref);
    }
    if (const auto* ref = std::get_if<story::ItemCountRef>(&operand)) {
        return static_cast<double>(ctx.store.getItemCount(ref->itemId));
    }
    if (const auto* ref = std::get_if<story::FlagRef>(&operand)) {
        return ctx.store.getAttribute(ref->key);
    }

    const auto& literal = std::get<Value>(operand);
    const auto* text = std::get_if<std::string>(&literal);
    if (text == nullptr) {
        return literal;
    }
    if (!text->empty() && text->front() == '$') {
        auto value = ctx.store.getAttribute(std::string_view(*text).substr(1));
        if (!story::isAbsent(value)) {
            return value;
        }
    }
    if (ctx.resolveValue) {
        if (auto resolved = ctx.resolveValue(*text)) {
            return *resolved;
        }
    }
    return literal;
}

namespace {

/// Operand named @p name: the `operands` entry when present, otherwise
/// the literal parameter of the same name.
story::Operand operandOf(const ConditionNode& node, std::string_view name) {
    if (auto it = node.operands.find(name); it != node.operands.end()) {
        return it->second;
    }
    if (const auto* param = story::findParam(node.params, name)) {
        return *param;
    }
    return Value{};
}

ParamConfig param(std::string name, std::string label, ParamType type,
                  std::string entityType = {}) {
    return ParamConfig{.name = std::move(name),
                       .label = std::move(label),
                       .type = type,
                       .entityType = std::move(entityType)};
}

class LogicAndCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kLogicAnd; }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        for (const auto& child : node.children) {
            if (!ctx.evaluate || !ctx.evaluate(child)) {
                return false;
            }
        }
        return true;
    }

    ConditionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()), .label = "AND",
                .description = "All children are true"};
    }
};

class LogicOrCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kLogicOr; }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        for (const auto& child : node.children) {
            if (ctx.evaluate && ctx.evaluate(child)) {
                return true;
            }
        }
        return false;
    }

    ConditionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()), .label = "OR",
                .description = "Any child is true"};
    }
};

class LogicNotCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kLogicNot; }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        if (node.children.empty() || !ctx.evaluate) {
            return true;
        }
        return !ctx.evaluate(node.children.front());
    }

    ConditionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()), .label = "NOT",
                .description = "Negates the first child"};
    }
};

class ValueCompareCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kValueCompare; }

    bool Validate(const ConditionNode& node) const override {
        auto op = paramText(node.params, "operator");
        return op.empty() || story::parseCompareOp(op).has_value();
    }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        auto opName = paramText(node.params, "operator");
        auto op = story::parseCompareOp(opName.empty() ? "==" : opName)
                      .value_or(story::CompareOp::Equal);
        return story::compareValues(ResolveOperand(operandOf(node, "left"), ctx),
                                    ResolveOperand(operandOf(node, "right"), ctx), op);
    }

    ConditionMetadata GetMetadata() const override {
        auto op = param("operator", "Operator", ParamType::Select);
        for (const char* symbol : {"==", "!=", ">", ">=", "<", "<=", "contains"}) {
            op.options.push_back({symbol, Value{std::string(symbol)}});
        }
        op.defaultValue = std::string("==");
        return {.id = std::string(GetId()),
                .label = "Compare",
                .params = {param("left", "Left", ParamType::String), op,
                           param("right", "Right", ParamType::String)}};
    }
};

class HasItemCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kHasItem; }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        auto itemId = paramText(node.params, "itemId");
        if (itemId.empty()) {
            return false;
        }
        double count = story::paramNumber(node.params, "count", 1.0);
        if (count <= 0.0) {
            count = 1.0;
        }
        return ctx.store.hasItem(itemId, story::saturateToInt32(std::ceil(count)));
    }

    ConditionMetadata GetMetadata() const override {
        auto count = param("count", "Count", ParamType::Number);
        count.defaultValue = 1.0;
        return {.id = std::string(GetId()),
                .label = "Has Item",
                .params = {param("itemId", "Item", ParamType::Entity, "item"), count}};
    }
};

class HasClueCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kHasClue; }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        auto clueId = paramText(node.params, "clueId");
        if (clueId.empty()) {
            return false;
        }
        return ctx.store.hasClue(clueId, paramText(node.params, "characterId"));
    }

    ConditionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Has Clue",
                .params = {param("clueId", "Clue", ParamType::Entity, "clue"),
                           param("characterId", "Character", ParamType::Entity, "character")}};
    }
};

class CheckFlagCondition final : public IConditionExtension {
public:
    std::string_view GetId() const override { return story::condition_type::kCheckFlag; }

    bool Evaluate(const ConditionNode& node, const ConditionContext& ctx) const override {
        auto key = paramText(node.params, "key");
        if (key.empty()) {
            return false;
        }
        bool expected = true;
        if (const auto* value = story::findParam(node.params, "expected");
            value != nullptr && !story::isAbsent(*value)) {
            expected = story::toBool(*value);
        }
        return story::toBool(ResolveOperand(story::FlagRef{key}, ctx)) == expected;
    }

    ConditionMetadata GetMetadata() const override {
        auto expected = param("expected", "Expected", ParamType::Boolean);
        expected.defaultValue = true;
        return {.id = std::string(GetId()),
                .label = "Check Flag",
                .params = {param("key", "Flag key", ParamType::String), expected}};
    }
};

} // namespace

void RegisterBuiltinConditions(ConditionRegistry& registry) {
    registry.Register(std::make_unique<LogicAndCondition>());
    registry.Register(std::make_unique<LogicOrCondition>());
    registry.Register(std::make_unique<LogicNotCondition>());
    registry.Register(std::make_unique<ValueCompareCondition>());
    registry.Register(std::make_unique<HasItemCondition>());
    registry.Register(std::make_unique<HasClueCondition>());
    registry.Register(std::make_unique<CheckFlagCondition>());
}

} // namespace nrt::logic
