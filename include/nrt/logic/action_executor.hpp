#pragma once

/// @file action_executor.hpp
/// @brief Sequences authored action lists against the ActionRegistry with
/// delay, async and error policy.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nrt/foundation/story_result.hpp"
#include "nrt/logic/action_extension.hpp"
#include "nrt/story/logic_types.hpp"

namespace nrt::foundation {
class TimerQueue;
}

namespace nrt::logic {

class ActionRegistry;

/// Runs action groups.
///
/// Entries run strictly in order. An entry's `delay` and a handler's
/// requested suspension (WAIT) park the group on the TimerQueue; the
/// remaining entries run when the timer fires. `async` entries are
/// detached onto the queue and never awaited. A failing synchronous
/// entry ends the group with its error unless it is marked
/// `ignoreError`.
///
/// The completion callback is invoked exactly once per group, either
/// before ExecuteGroup() returns (GroupState::Completed) or later from
/// the timer queue (GroupState::Pending).
///
/// InvalidatePending() bumps a generation counter. Continuations
/// scheduled under an older generation complete with ActionCancelled
/// instead of running.
class ActionExecutor {
public:
    using GroupCallback = std::function<void(foundation::StoryResult<void>)>;

    enum class GroupState : uint8_t { Completed, Pending };

    ActionExecutor(ActionRegistry& registry, state::VariableStore& store,
                   event::EventBus& bus, foundation::TimerQueue& timers);

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    GroupState ExecuteGroup(const std::vector<story::ActionSpec>& actions,
                            GroupCallback onComplete = {},
                            std::string scope = "global");

    /// Resolve, validate and run one action now, ignoring its scheduling
    /// flags. Unknown types and rejected parameters yield Done.
    foundation::StoryResult<ActionOutcome> ExecuteOne(const story::ActionSpec& action,
                                                      const std::string& scope = "global");

    /// Drop every continuation scheduled so far.
    void InvalidatePending() noexcept { ++generation_; }

    [[nodiscard]] uint64_t Generation() const noexcept { return generation_; }

    /// Groups currently parked on a timer.
    [[nodiscard]] std::size_t PendingGroups() const noexcept { return pendingGroups_; }

private:
    struct GroupRun;

    GroupState runFrom(const std::shared_ptr<GroupRun>& run);

    void resume(const std::shared_ptr<GroupRun>& run);

    void detach(const story::ActionSpec& action, const std::string& scope);

    void finish(const std::shared_ptr<GroupRun>& run, foundation::StoryResult<void> result);

    ActionRegistry& registry_;
    state::VariableStore& store_;
    event::EventBus& bus_;
    foundation::TimerQueue& timers_;
    uint64_t generation_ = 0;
    std::size_t pendingGroups_ = 0;
};

} // namespace nrt::logic
