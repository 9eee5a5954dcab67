/// @file story_runtime_test.cpp
/// @brief Unit tests for StoryRuntime wiring.

#include <gtest/gtest.h>

#include <string>

#include "nrt/engine/story_runtime.hpp"
#include "nrt/event/story_events.hpp"

using namespace nrt;
using namespace nrt::engine;

TEST(StoryRuntimeTest, RegistersBuiltins) {
    auto runtime = StoryRuntime::Create();
    ASSERT_NE(runtime, nullptr);

    EXPECT_TRUE(runtime->actions().Has("ADD_ITEM"));
    EXPECT_TRUE(runtime->actions().Has("WAIT"));
    EXPECT_TRUE(runtime->conditionRegistry().Has("VAL_COMPARE"));
    EXPECT_EQ(runtime->conditionRegistry().Size(), 7u);
    EXPECT_FALSE(runtime->engine().isLoaded());
}

TEST(StoryRuntimeTest, KeepsConfig) {
    EngineConfig cfg;
    cfg.commandHistoryLimit = 7;
    cfg.deadEndToast = false;

    auto runtime = StoryRuntime::Create(cfg);
    EXPECT_EQ(runtime->config().commandHistoryLimit, 7u);
    EXPECT_FALSE(runtime->config().deadEndToast);
}

TEST(StoryRuntimeTest, StorePublishesOnRuntimeBus) {
    auto runtime = StoryRuntime::Create();

    story::StoryAsset asset;
    asset.items.push_back(story::Item{.id = "coin", .name = "Coin", .stackable = true});
    runtime->store().init(asset);

    int added = 0;
    runtime->bus().Subscribe<event::InventoryChanged>(
        event::topics::kInventoryAdded, [&](const event::InventoryChanged& e) {
            EXPECT_EQ(e.itemId, "coin");
            ++added;
        });

    runtime->store().addItem("coin", 2);
    EXPECT_EQ(added, 1);
}

TEST(StoryRuntimeTest, RuntimesAreIsolated) {
    auto first = StoryRuntime::Create();
    auto second = StoryRuntime::Create();

    story::StoryAsset asset;
    asset.items.push_back(story::Item{.id = "coin", .name = "Coin", .stackable = true});
    first->store().init(asset);
    second->store().init(asset);

    int secondEvents = 0;
    second->bus().Subscribe(event::topics::kInventoryAdded,
                            [&](const std::any&) { ++secondEvents; });

    first->store().addItem("coin");
    EXPECT_EQ(first->store().getItemCount("coin"), 1);
    EXPECT_EQ(second->store().getItemCount("coin"), 0);
    EXPECT_EQ(secondEvents, 0);
}

TEST(StoryRuntimeTest, ActionsReachStoreThroughExecutor) {
    auto runtime = StoryRuntime::Create();

    story::StoryAsset asset;
    asset.items.push_back(story::Item{.id = "lamp", .name = "Lamp", .stackable = false});
    runtime->store().init(asset);

    story::ActionSpec spec{.id = "a1",
                           .type = "ADD_ITEM",
                           .params = {{"itemId", story::Value(std::string("lamp"))}}};
    auto state = runtime->executor().ExecuteGroup({spec});

    EXPECT_EQ(state, logic::ActionExecutor::GroupState::Completed);
    EXPECT_TRUE(runtime->store().hasItem("lamp"));
}
