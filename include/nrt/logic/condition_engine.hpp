#pragma once

/// @file condition_engine.hpp
/// @brief Evaluates guards: structured condition trees through the
/// ConditionRegistry and legacy expressions through the VariableStore.

#include <optional>
#include <string>
#include <string_view>

#include "nrt/logic/condition_extension.hpp"
#include "nrt/story/logic_types.hpp"

namespace nrt::logic {

class ConditionRegistry;

class ConditionEngine {
public:
    ConditionEngine(const ConditionRegistry& registry, const state::VariableStore& store,
                    event::EventBus& bus);

    ConditionEngine(const ConditionEngine&) = delete;
    ConditionEngine& operator=(const ConditionEngine&) = delete;

    /// Single entry point for both guard forms.
    [[nodiscard]] bool evaluate(const story::Guard& guard) const;

    /// An absent guard passes.
    [[nodiscard]] bool evaluate(const std::optional<story::Guard>& guard) const;

    /// Registry dispatch followed by the node's own `negate`.
    [[nodiscard]] bool evaluate(const story::ConditionNode& node) const;

    /// Delegates to VariableStore::evaluateCondition().
    [[nodiscard]] bool evaluateLegacy(std::string_view expression) const;

    /// Hook consulted for string operands no built-in rule resolved.
    void setValueResolver(ValueResolver resolver) { resolver_ = std::move(resolver); }

    void setScope(std::string scope) { scope_ = std::move(scope); }

private:
    const ConditionRegistry& registry_;
    const state::VariableStore& store_;
    event::EventBus& bus_;
    ValueResolver resolver_;
    std::string scope_ = "global";
};

} // namespace nrt::logic
