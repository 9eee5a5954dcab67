#pragma once

/// @file action_registry.hpp
/// @brief String-keyed table of action handlers.

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nrt/logic/action_extension.hpp"

namespace nrt::logic {

/// Owns action handlers keyed by their type id.
///
/// Constructed once per runtime and injected into the executor; there is
/// no global instance. Registering an id that already exists replaces
/// the previous handler in place.
class ActionRegistry {
public:
    ActionRegistry() = default;

    ActionRegistry(const ActionRegistry&) = delete;
    ActionRegistry& operator=(const ActionRegistry&) = delete;

    void Register(std::unique_ptr<IActionExtension> extension);

    /// Handler for @p type, or nullptr.
    [[nodiscard]] IActionExtension* Get(std::string_view type) const;

    [[nodiscard]] bool Has(std::string_view type) const { return Get(type) != nullptr; }

    /// Registered ids in registration order.
    [[nodiscard]] std::vector<std::string> List() const { return order_; }

    /// Metadata of every handler, in registration order.
    [[nodiscard]] std::vector<ActionMetadata> Catalog() const;

    [[nodiscard]] std::size_t Size() const noexcept { return handlers_.size(); }

private:
    std::unordered_map<std::string, std::unique_ptr<IActionExtension>> handlers_;
    std::vector<std::string> order_;
};

/// Register UPDATE_ATTRIBUTE, inventory, clue, UI, audio, WAIT and flow
/// handlers.
void RegisterBuiltinActions(ActionRegistry& registry);

/// Registry pre-populated with the built-in handlers.
[[nodiscard]] std::unique_ptr<ActionRegistry> CreateDefaultActionRegistry();

} // namespace nrt::logic
