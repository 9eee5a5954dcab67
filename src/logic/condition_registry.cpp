/// @file condition_registry.cpp
/// @brief ConditionRegistry implementation.

#include "nrt/logic/condition_registry.hpp"

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::logic {

using foundation::LogCategory;

void ConditionRegistry::Register(std::unique_ptr<IConditionExtension> extension) {
    if (!extension) {
        return;
    }
    std::string id(extension->GetId());
    auto [it, inserted] = handlers_.insert_or_assign(id, std::move(extension));
    if (inserted) {
        order_.push_back(id);
    } else {
        NRT_LOG_DEBUG(LogCategory::Condition, "Replaced condition handler " + id);
    }
}

IConditionExtension* ConditionRegistry::Get(std::string_view type) const {
    auto it = handlers_.find(std::string(type));
    return it == handlers_.end() ? nullptr : it->second.get();
}

bool ConditionRegistry::Evaluate(const story::ConditionNode& node,
                                 const ConditionContext& ctx) const {
    const auto* handler = Get(node.type);
    if (handler == nullptr) {
        NRT_LOG_WARN(LogCategory::Condition, "No handler for condition " + node.type);
        return false;
    }
    if (!handler->Validate(node)) {
        NRT_LOG_WARN(LogCategory::Condition, "Validation failed for condition " + node.type);
        return false;
    }
    return handler->Evaluate(node, ctx);
}

std::vector<ConditionMetadata> ConditionRegistry::Catalog() const {
    std::vector<ConditionMetadata> catalog;
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

std::unique_ptr<ConditionRegistry> CreateDefaultConditionRegistry() {
    auto registry = std::make_unique<ConditionRegistry>();
    RegisterBuiltinConditions(*registry);
    return registry;
}

} // namespace nrt::logic
