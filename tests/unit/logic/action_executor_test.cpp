/// @file action_executor_test.cpp
/// @brief Unit tests for ActionExecutor sequencing, delays, async entries,
///        error policy and generation invalidation.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "nrt/event/event_bus.hpp"
#include "nrt/foundation/timer_queue.hpp"
#include "nrt/logic/action_executor.hpp"
#include "nrt/logic/action_registry.hpp"
#include "nrt/state/variable_store.hpp"

using namespace nrt;
using namespace nrt::logic;
using foundation::ErrorCode;
using foundation::StoryError;
using foundation::StoryResult;
using std::chrono::milliseconds;
using story::ActionSpec;
using story::Params;
using story::Value;

namespace {

/// Appends its `tag` parameter to a shared log.
class RecordAction final : public IActionExtension {
public:
    explicit RecordAction(std::vector<std::string>* log) : log_(log) {}

    std::string_view GetId() const override { return "RECORD"; }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        log_->push_back(story::paramText(params, "tag") + "@" + ctx.scope);
        return StoryResult<ActionOutcome>::ok(ActionOutcome::Done());
    }

private:
    std::vector<std::string>* log_;
};

class FailAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return "FAIL"; }

    StoryResult<ActionOutcome> Execute(const Params&, ActionContext&) override {
        return StoryResult<ActionOutcome>::err(StoryError(ErrorCode::ActionFailed, "boom"));
    }
};

class ThrowAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return "THROW"; }

    StoryResult<ActionOutcome> Execute(const Params&, ActionContext&) override {
        throw std::runtime_error("handler exploded");
    }
};

class PickyAction final : public IActionExtension {
public:
    explicit PickyAction(std::vector<std::string>* log) : log_(log) {}

    std::string_view GetId() const override { return "PICKY"; }

    bool Validate(const Params& params) const override {
        return story::findParam(params, "ok") != nullptr;
    }

    StoryResult<ActionOutcome> Execute(const Params&, ActionContext&) override {
        log_->push_back("picky");
        return StoryResult<ActionOutcome>::ok(ActionOutcome::Done());
    }

private:
    std::vector<std::string>* log_;
};

ActionSpec record(const char* tag) {
    ActionSpec spec;
    spec.id = std::string("act_") + tag;
    spec.type = "RECORD";
    spec.params = {{"tag", Value(std::string(tag))}};
    return spec;
}

ActionSpec ofType(const char* type) {
    ActionSpec spec;
    spec.id = std::string("act_") + type;
    spec.type = type;
    return spec;
}

ActionSpec wait(double seconds) {
    ActionSpec spec = ofType(story::action_type::kWait);
    spec.params = {{"duration", Value(seconds)}};
    return spec;
}

} // namespace

class ActionExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_->Register(std::make_unique<RecordAction>(&log_));
        registry_->Register(std::make_unique<FailAction>());
        registry_->Register(std::make_unique<ThrowAction>());
        registry_->Register(std::make_unique<PickyAction>(&log_));
    }

    ActionExecutor::GroupState runGroup(const std::vector<ActionSpec>& actions) {
        return executor_.ExecuteGroup(actions, [this](StoryResult<void> result) {
            ++callbacks_;
            lastResult_ = std::move(result);
        });
    }

    std::vector<std::string> log_;
    int callbacks_ = 0;
    StoryResult<void> lastResult_ = StoryResult<void>::ok();

    event::EventBus bus_;
    foundation::TimerQueue timers_;
    state::VariableStore store_{&bus_};
    std::unique_ptr<ActionRegistry> registry_ = CreateDefaultActionRegistry();
    ActionExecutor executor_{*registry_, store_, bus_, timers_};
};

// ============================================================================
// Sequencing
// ============================================================================

TEST_F(ActionExecutorTest, RunsInOrderAndCompletesOnce) {
    auto state = runGroup({record("a"), record("b"), record("c")});

    EXPECT_EQ(state, ActionExecutor::GroupState::Completed);
    EXPECT_EQ(log_, (std::vector<std::string>{"a@global", "b@global", "c@global"}));
    EXPECT_EQ(callbacks_, 1);
    EXPECT_TRUE(lastResult_.hasValue());
}

TEST_F(ActionExecutorTest, EmptyGroupCompletes) {
    EXPECT_EQ(runGroup({}), ActionExecutor::GroupState::Completed);
    EXPECT_EQ(callbacks_, 1);
}

TEST_F(ActionExecutorTest, ScopeIsPassedToHandlers) {
    executor_.ExecuteGroup({record("a")}, {}, "player_2");
    EXPECT_EQ(log_, (std::vector<std::string>{"a@player_2"}));
}

TEST_F(ActionExecutorTest, UnknownTypeIsSkipped) {
    runGroup({record("a"), ofType("TELEPORT"), record("b")});
    EXPECT_EQ(log_, (std::vector<std::string>{"a@global", "b@global"}));
    EXPECT_TRUE(lastResult_.hasValue());
}

TEST_F(ActionExecutorTest, RejectedParamsAreSkipped) {
    auto accepted = ofType("PICKY");
    accepted.params = {{"ok", Value(true)}};
    runGroup({ofType("PICKY"), accepted});
    EXPECT_EQ(log_, (std::vector<std::string>{"picky"}));
}

// ============================================================================
// Error policy
// ============================================================================

TEST_F(ActionExecutorTest, SyncFailureEndsGroup) {
    auto state = runGroup({record("a"), ofType("FAIL"), record("b")});

    EXPECT_EQ(state, ActionExecutor::GroupState::Completed);
    EXPECT_EQ(log_, (std::vector<std::string>{"a@global"}));
    EXPECT_EQ(callbacks_, 1);
    ASSERT_TRUE(lastResult_.hasError());
    EXPECT_EQ(lastResult_.error().code(), ErrorCode::ActionFailed);
}

TEST_F(ActionExecutorTest, IgnoreErrorContinues) {
    auto failing = ofType("FAIL");
    failing.ignoreError = true;
    runGroup({failing, record("b")});

    EXPECT_EQ(log_, (std::vector<std::string>{"b@global"}));
    EXPECT_TRUE(lastResult_.hasValue());
}

TEST_F(ActionExecutorTest, ThrowingHandlerBecomesActionFailed) {
    auto result = executor_.ExecuteOne(ofType("THROW"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ActionFailed);
    ASSERT_NE(result.error().context<std::string>(), nullptr);
    EXPECT_EQ(*result.error().context<std::string>(), "act_THROW");
}

// ============================================================================
// Delays and suspension
// ============================================================================

TEST_F(ActionExecutorTest, DelayParksGroupOnTimer) {
    auto delayed = record("b");
    delayed.delay = milliseconds(500);
    auto state = runGroup({record("a"), delayed, record("c")});

    EXPECT_EQ(state, ActionExecutor::GroupState::Pending);
    EXPECT_EQ(log_, (std::vector<std::string>{"a@global"}));
    EXPECT_EQ(executor_.PendingGroups(), 1u);
    EXPECT_EQ(callbacks_, 0);

    timers_.advance(milliseconds(499));
    EXPECT_EQ(log_.size(), 1u);

    timers_.advance(milliseconds(1));
    EXPECT_EQ(log_, (std::vector<std::string>{"a@global", "b@global", "c@global"}));
    EXPECT_EQ(executor_.PendingGroups(), 0u);
    EXPECT_EQ(callbacks_, 1);
}

TEST_F(ActionExecutorTest, WaitSuspendsRemainingEntries) {
    auto state = runGroup({record("a"), wait(1.5), record("b")});

    EXPECT_EQ(state, ActionExecutor::GroupState::Pending);
    EXPECT_EQ(log_.size(), 1u);

    timers_.advance(milliseconds(1499));
    EXPECT_EQ(log_.size(), 1u);
    timers_.advance(milliseconds(1));
    EXPECT_EQ(log_.size(), 2u);
    EXPECT_EQ(callbacks_, 1);
    EXPECT_TRUE(lastResult_.hasValue());
}

TEST_F(ActionExecutorTest, ExecuteOneIgnoresSchedulingFlags) {
    auto delayed = record("now");
    delayed.delay = milliseconds(1000);
    delayed.async = true;
    auto result = executor_.ExecuteOne(delayed);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(log_, (std::vector<std::string>{"now@global"}));
    EXPECT_EQ(timers_.pendingCount(), 0u);
}

// ============================================================================
// Async entries
// ============================================================================

TEST_F(ActionExecutorTest, AsyncEntryIsDetached) {
    auto detached = record("async");
    detached.async = true;
    auto state = runGroup({detached, record("sync")});

    EXPECT_EQ(state, ActionExecutor::GroupState::Completed);
    EXPECT_EQ(log_, (std::vector<std::string>{"sync@global"}));
    EXPECT_EQ(callbacks_, 1);

    timers_.runDue();
    EXPECT_EQ(log_, (std::vector<std::string>{"sync@global", "async@global"}));
}

TEST_F(ActionExecutorTest, AsyncDelayAppliesInsideDetachedRun) {
    auto detached = record("late");
    detached.async = true;
    detached.delay = milliseconds(200);
    runGroup({detached});

    timers_.advance(milliseconds(199));
    EXPECT_TRUE(log_.empty());
    timers_.advance(milliseconds(1));
    EXPECT_EQ(log_, (std::vector<std::string>{"late@global"}));
}

TEST_F(ActionExecutorTest, AsyncFailureDoesNotFailGroup) {
    auto failing = ofType("FAIL");
    failing.async = true;
    runGroup({failing, record("b")});
    timers_.runDue();

    EXPECT_TRUE(lastResult_.hasValue());
    EXPECT_EQ(log_, (std::vector<std::string>{"b@global"}));
}

// ============================================================================
// Invalidation
// ============================================================================

TEST_F(ActionExecutorTest, InvalidateCancelsSuspendedGroup) {
    runGroup({wait(1.0), record("after")});
    auto before = executor_.Generation();

    executor_.InvalidatePending();
    EXPECT_EQ(executor_.Generation(), before + 1);

    timers_.advance(milliseconds(1000));
    EXPECT_TRUE(log_.empty());
    EXPECT_EQ(callbacks_, 1);
    ASSERT_TRUE(lastResult_.hasError());
    EXPECT_EQ(lastResult_.error().code(), ErrorCode::ActionCancelled);
}

TEST_F(ActionExecutorTest, InvalidateDropsDetachedAction) {
    auto detached = record("async");
    detached.async = true;
    runGroup({detached});

    executor_.InvalidatePending();
    timers_.runDue();
    EXPECT_TRUE(log_.empty());
}

TEST_F(ActionExecutorTest, GroupsStartedAfterInvalidateRun) {
    executor_.InvalidatePending();
    runGroup({wait(0.5), record("x")});
    timers_.advance(milliseconds(500));
    EXPECT_EQ(log_, (std::vector<std::string>{"x@global"}));
    EXPECT_TRUE(lastResult_.hasValue());
}
