#pragma once

/// @file story_runtime.hpp
/// @brief Owns and wires every runtime component for one story instance.

#include <memory>

#include "nrt/engine/engine_config.hpp"
#include "nrt/engine/narrative_engine.hpp"
#include "nrt/event/event_bus.hpp"
#include "nrt/foundation/timer_queue.hpp"
#include "nrt/logic/action_executor.hpp"
#include "nrt/logic/action_registry.hpp"
#include "nrt/logic/condition_engine.hpp"
#include "nrt/logic/condition_registry.hpp"
#include "nrt/scene/scene_graph.hpp"
#include "nrt/state/variable_store.hpp"

namespace nrt::engine {

/// One fully wired runtime: bus, timers, store, registries (with the
/// built-in handlers), executor, condition engine, scene graph and
/// narrative engine.
///
/// Members are declared in dependency order so destruction runs from the
/// engine down to the bus. A multi-session host creates one runtime per
/// story instance.
///
/// Usage:
/// @code
///   auto runtime = StoryRuntime::Create();
///   runtime->engine().loadStory(story);
///   runtime->engine().startSegment(story.activeSegmentId);
///   runtime->timers().advance(std::chrono::milliseconds(16));
/// @endcode
class StoryRuntime {
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    [[nodiscard]] static std::unique_ptr<StoryRuntime> Create(EngineConfig config = {});

    /// Reachable only through Create().
    StoryRuntime(CreateTag, EngineConfig config);

    StoryRuntime(const StoryRuntime&) = delete;
    StoryRuntime& operator=(const StoryRuntime&) = delete;

    [[nodiscard]] event::EventBus& bus() noexcept { return bus_; }
    [[nodiscard]] foundation::TimerQueue& timers() noexcept { return timers_; }
    [[nodiscard]] state::VariableStore& store() noexcept { return store_; }
    [[nodiscard]] logic::ActionRegistry& actions() noexcept { return *actions_; }
    [[nodiscard]] logic::ConditionRegistry& conditionRegistry() noexcept { return *conditionRegistry_; }
    [[nodiscard]] logic::ActionExecutor& executor() noexcept { return executor_; }
    [[nodiscard]] logic::ConditionEngine& conditions() noexcept { return conditions_; }
    [[nodiscard]] scene::SceneGraph& scene() noexcept { return scene_; }
    [[nodiscard]] NarrativeEngine& engine() noexcept { return engine_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    event::EventBus bus_;
    foundation::TimerQueue timers_;
    state::VariableStore store_;
    std::unique_ptr<logic::ActionRegistry> actions_;
    std::unique_ptr<logic::ConditionRegistry> conditionRegistry_;
    logic::ActionExecutor executor_;
    logic::ConditionEngine conditions_;
    scene::SceneGraph scene_;
    NarrativeEngine engine_;
};

} // namespace nrt::engine
