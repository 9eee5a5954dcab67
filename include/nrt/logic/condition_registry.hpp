#pragma once

/// @file condition_registry.hpp
/// @brief String-keyed table of condition handlers.

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nrt/logic/condition_extension.hpp"

namespace nrt::logic {

/// Owns condition handlers keyed by their type id.
///
/// Registering an existing id replaces the previous handler in place.
class ConditionRegistry {
public:
    ConditionRegistry() = default;

    ConditionRegistry(const ConditionRegistry&) = delete;
    ConditionRegistry& operator=(const ConditionRegistry&) = delete;

    void Register(std::unique_ptr<IConditionExtension> extension);

    [[nodiscard]] IConditionExtension* Get(std::string_view type) const;

    [[nodiscard]] bool Has(std::string_view type) const { return Get(type) != nullptr; }

    /// Dispatch @p node to its handler. Unknown types and rejected nodes
    /// are warned about and evaluate to false. `negate` is not applied.
    [[nodiscard]] bool Evaluate(const story::ConditionNode& node,
                                const ConditionContext& ctx) const;

    [[nodiscard]] std::vector<std::string> List() const { return order_; }

    [[nodiscard]] std::vector<ConditionMetadata> Catalog() const;

    [[nodiscard]] std::size_t Size() const noexcept { return handlers_.size(); }

private:
    std::unordered_map<std::string, std::unique_ptr<IConditionExtension>> handlers_;
    std::vector<std::string> order_;
};

/// Register LOGIC_AND, LOGIC_OR, LOGIC_NOT, VAL_COMPARE, HAS_ITEM,
/// HAS_CLUE and CHECK_FLAG.
void RegisterBuiltinConditions(ConditionRegistry& registry);

[[nodiscard]] std::unique_ptr<ConditionRegistry> CreateDefaultConditionRegistry();

/// Resolve a comparison operand against the context's store and resolver.
///
/// Literals pass through, except strings starting with `$`, which read the
/// attribute named by the rest, and other strings, which are offered to
/// the resolver hook first.
[[nodiscard]] story::Value ResolveOperand(const story::Operand& operand,
                                          const ConditionContext& ctx);

} // namespace nrt::logic
