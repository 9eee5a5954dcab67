/// @file condition_engine.cpp
/// @brief ConditionEngine implementation.

#include "nrt/logic/condition_engine.hpp"

#include <exception>
#include <type_traits>

#include "nrt/foundation/runtime_logger.hpp"
#include "nrt/logic/condition_registry.hpp"
#include "nrt/state/variable_store.hpp"

namespace nrt::logic {

using foundation::LogCategory;

ConditionEngine::ConditionEngine(const ConditionRegistry& registry,
                                 const state::VariableStore& store, event::EventBus& bus)
    : registry_(registry), store_(store), bus_(bus) {}

bool ConditionEngine::evaluate(const story::Guard& guard) const {
    return std::visit(
        [this](const auto& g) -> bool {
            using G = std::decay_t<decltype(g)>;
            if constexpr (std::is_same_v<G, story::LegacyExpression>) {
                return evaluateLegacy(g.text);
            } else {
                return evaluate(g);
            }
        },
        guard);
}

bool ConditionEngine::evaluate(const std::optional<story::Guard>& guard) const {
    return !guard || evaluate(*guard);
}

bool ConditionEngine::evaluate(const story::ConditionNode& node) const {
    ConditionContext ctx{store_, bus_, scope_, resolver_, {}};
    ctx.evaluate = [this](const story::ConditionNode& child) { return evaluate(child); };

    bool result = false;
    try {
        result = registry_.Evaluate(node, ctx);
    } catch (const std::exception& e) {
        NRT_LOG_ERROR(LogCategory::Condition,
                      "Condition " + node.type + " threw: " + e.what());
        return false;
    }
    return node.negate ? !result : result;
}

bool ConditionEngine::evaluateLegacy(std::string_view expression) const {
    return store_.evaluateCondition(expression);
}

} // namespace nrt::logic
