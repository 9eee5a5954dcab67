/// @file action_registry.cpp
/// @brief ActionRegistry implementation.

#include "nrt/logic/action_registry.hpp"

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::logic {

using foundation::LogCategory;

void ActionRegistry::Register(std::unique_ptr<IActionExtension> extension) {
    if (!extension) {
        return;
    }
    std::string id(extension->GetId());
    auto [it, inserted] = handlers_.insert_or_assign(id, std::move(extension));
    if (inserted) {
        order_.push_back(id);
    } else {
        NRT_LOG_DEBUG(LogCategory::Action, "Replaced action handler " + id);
    }
}

IActionExtension* ActionRegistry::Get(std::string_view type) const {
    auto it = handlers_.find(std::string(type));
    return it == handlers_.end() ? nullptr : it->second.get();
}

std::vector<ActionMetadata> ActionRegistry::Catalog() const {
    std::vector<ActionMetadata> catalog;
    catalog.reserve(order_.size());
    for (const auto& id : order_) {
        auto meta = handlers_.at(id)->GetMetadata();
        if (meta.id.empty()) {
            meta.id = id;
        }
        if (meta.label.empty()) {
            meta.label = id;
        }
        catalog.push_back(std::move(meta));
    }
    return catalog;
}

std::unique_ptr<ActionRegistry> CreateDefaultActionRegistry() {
    auto registry = std::make_unique<ActionRegistry>();
    RegisterBuiltinActions(*registry);
    return registry;
}

} // namespace nrt::logic
