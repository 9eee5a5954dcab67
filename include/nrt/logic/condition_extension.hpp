#pragma once

/// @file condition_extension.hpp
/// @brief IConditionExtension interface implemented by every condition
/// handler.

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "nrt/logic/extension_types.hpp"
#include "nrt/story/logic_types.hpp"

namespace nrt::event {
class EventBus;
}

namespace nrt::state {
class VariableStore;
}

namespace nrt::logic {

/// Optional resolver for custom value namespaces (quest state, runtime
/// flags). Returns nullopt to decline.
using ValueResolver = std::function<std::optional<story::Value>(std::string_view)>;

/// Collaborators available while evaluating one condition tree.
struct ConditionContext {
    const state::VariableStore& store;
    event::EventBus& bus;
    std::string scope = "global";
    ValueResolver resolveValue;
    /// Evaluates a child node with the same context, negate included.
    std::function<bool(const story::ConditionNode&)> evaluate;
};

/// Abstract base for condition handlers.
class IConditionExtension {
public:
    virtual ~IConditionExtension() = default;

    /// Stable type id, e.g. "HAS_ITEM".
    [[nodiscard]] virtual std::string_view GetId() const = 0;

    /// Reject malformed nodes. A rejected node evaluates to false.
    [[nodiscard]] virtual bool Validate(const story::ConditionNode& /*node*/) const {
        return true;
    }

    /// Result before the node's own `negate` is applied.
    [[nodiscard]] virtual bool Evaluate(const story::ConditionNode& node,
                                        const ConditionContext& ctx) const = 0;

    [[nodiscard]] virtual ConditionMetadata GetMetadata() const {
        ConditionMetadata meta;
        meta.id = std::string(GetId());
        meta.label = meta.id;
        return meta;
    }
};

} // namespace nrt::logic
