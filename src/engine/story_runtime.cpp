/// @file story_runtime.cpp
/// @brief StoryRuntime construction.

#include "nrt/engine/story_runtime.hpp"

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::engine {

std::unique_ptr<StoryRuntime> StoryRuntime::Create(EngineConfig config) {
    return std::make_unique<StoryRuntime>(CreateTag{}, std::move(config));
}

StoryRuntime::StoryRuntime(CreateTag, EngineConfig config)
    : config_(std::move(config)),
      store_(&bus_),
      actions_(logic::CreateDefaultActionRegistry()),
      conditionRegistry_(logic::CreateDefaultConditionRegistry()),
      executor_(*actions_, store_, bus_, timers_),
      conditions_(*conditionRegistry_, store_, bus_),
      engine_(store_, bus_, executor_, conditions_, scene_, config_) {
    NRT_LOG_DEBUG(foundation::LogCategory::Core,
                  "Runtime wired with " + std::to_string(actions_->Size()) + " actions and " +
                      std::to_string(conditionRegistry_->Size()) + " conditions");
}

} // namespace nrt::engine
