/// @file action_executor.cpp
/// @brief ActionExecutor implementation.

#include "nrt/logic/action_executor.hpp"

#include <exception>

#include "nrt/foundation/runtime_logger.hpp"
#include "nrt/foundation/timer_queue.hpp"
#include "nrt/logic/action_registry.hpp"

namespace nrt::logic {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RuntimeLogger;
using foundation::StoryError;
using foundation::StoryResult;

namespace {

void logAction(LogLevel level, const story::ActionSpec& action, std::string_view msg) {
    auto& logger = RuntimeLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Action)) {
        return;
    }
    LogContext ctx;
    ctx.actionType = action.type;
    if (!action.id.empty()) {
        ctx.extra["action"] = action.id;
    }
    logger.logWithContext(level, LogCategory::Action, msg, ctx);
}

} // namespace

struct ActionExecutor::GroupRun {
    std::vector<story::ActionSpec> actions;
    std::size_t index = 0;
    bool delayServed = false;
    std::string scope;
    GroupCallback onComplete;
    uint64_t generation = 0;
};

ActionExecutor::ActionExecutor(ActionRegistry& registry, state::VariableStore& store,
                               event::EventBus& bus, foundation::TimerQueue& timers)
    : registry_(registry), store_(store), bus_(bus), timers_(timers) {}

ActionExecutor::GroupState ActionExecutor::ExecuteGroup(
    const std::vector<story::ActionSpec>& actions, GroupCallback onComplete, std::string scope) {
    auto run = std::make_shared<GroupRun>();
    run->actions = actions;
    run->scope = std::move(scope);
    run->onComplete = std::move(onComplete);
    run->generation = generation_;
    return runFrom(run);
}

StoryResult<ActionOutcome> ActionExecutor::ExecuteOne(const story::ActionSpec& action,
                                                      const std::string& scope) {
    auto* handler = registry_.Get(action.type);
    if (handler == nullptr) {
        logAction(LogLevel::Warning, action, "No handler registered for action type");
        return StoryResult<ActionOutcome>::ok(ActionOutcome::Done());
    }
    if (!handler->Validate(action.params)) {
        logAction(LogLevel::Warning, action, "Validation failed, action skipped");
        return StoryResult<ActionOutcome>::ok(ActionOutcome::Done());
    }

    logAction(LogLevel::Debug, action, "Executing");

    ActionContext ctx{store_, bus_, scope};
    try {
        return handler->Execute(action.params, ctx);
    } catch (const std::exception& e) {
        return StoryResult<ActionOutcome>::err(
            StoryError(ErrorCode::ActionFailed,
                       "action " + action.type + " threw: " + e.what(), action.id));
    }
}

ActionExecutor::GroupState ActionExecutor::runFrom(const std::shared_ptr<GroupRun>& run) {
    while (run->index < run->actions.size()) {
        const auto& action = run->actions[run->index];

        if (action.async) {
            ++run->index;
            detach(action, run->scope);
            continue;
        }

        if (action.delay && action.delay->count() > 0 && !run->delayServed) {
            run->delayServed = true;
            ++pendingGroups_;
            timers_.schedule(*action.delay, [this, run] { resume(run); });
            return GroupState::Pending;
        }
        run->delayServed = false;
        ++run->index;

        auto result = ExecuteOne(action, run->scope);
        if (result.hasError()) {
            if (action.ignoreError) {
                logAction(LogLevel::Warning, action,
                          "Ignored failure: " + std::string(result.error().message()));
                continue;
            }
            logAction(LogLevel::Error, action, result.error().message());
            finish(run, StoryResult<void>::err(result.error()));
            return GroupState::Completed;
        }

        if (result.value().Suspends()) {
            ++pendingGroups_;
            timers_.schedule(result.value().suspendFor, [this, run] { resume(run); });
            return GroupState::Pending;
        }
    }

    finish(run, StoryResult<void>::ok());
    return GroupState::Completed;
}

void ActionExecutor::resume(const std::shared_ptr<GroupRun>& run) {
    if (pendingGroups_ > 0) {
        --pendingGroups_;
    }
    if (run->generation != generation_) {
        NRT_LOG_DEBUG(LogCategory::Action, "Discarded stale action group continuation");
        finish(run, StoryResult<void>::err(
                        StoryError(ErrorCode::ActionCancelled, "story reloaded")));
        return;
    }
    runFrom(run);
}

void ActionExecutor::detach(const story::ActionSpec& action, const std::string& scope) {
    auto delay = action.delay.value_or(std::chrono::milliseconds(0));
    auto generation = generation_;

    timers_.schedule(delay, [this, action, scope, generation] {
        if (generation != generation_) {
            logAction(LogLevel::Debug, action, "Discarded stale async action");
            return;
        }
        auto result = ExecuteOne(action, scope);
        if (result.hasValue()) {
            return;
        }
        if (action.ignoreError) {
            logAction(LogLevel::Warning, action,
                      "Ignored async failure: " + std::string(result.error().message()));
        } else {
            logAction(LogLevel::Error, action,
                      "Unhandled async failure: " + std::string(result.error().message()));
        }
    });
}

void ActionExecutor::finish(const std::shared_ptr<GroupRun>& run, StoryResult<void> result) {
    auto callback = std::move(run->onComplete);
    run->onComplete = nullptr;
    if (callback) {
        callback(std::move(result));
    }
}

} // namespace nrt::logic
