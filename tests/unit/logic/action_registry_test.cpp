/// @file action_registry_test.cpp
/// @brief Unit tests for ActionRegistry and the built-in action handlers.

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "nrt/event/event_bus.hpp"
#include "nrt/event/story_events.hpp"
#include "nrt/logic/action_registry.hpp"
#include "nrt/state/variable_store.hpp"

using namespace nrt;
using namespace nrt::logic;
using story::Params;
using story::Value;

namespace {

Value text(const char* s) { return Value(std::string(s)); }

class EchoAction final : public IActionExtension {
public:
    explicit EchoAction(std::string label) : label_(std::move(label)) {}

    std::string_view GetId() const override { return "ECHO"; }

    foundation::StoryResult<ActionOutcome> Execute(const Params&, ActionContext&) override {
        return foundation::StoryResult<ActionOutcome>::ok(ActionOutcome::Done());
    }

    ActionMetadata GetMetadata() const override {
        ActionMetadata meta;
        meta.label = label_;
        return meta;
    }

private:
    std::string label_;
};

} // namespace

// ============================================================================
// Registry
// ============================================================================

TEST(ActionRegistryTest, RegisterAndGet) {
    ActionRegistry registry;
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(registry.Get("ECHO"), nullptr);

    registry.Register(std::make_unique<EchoAction>("Echo"));
    EXPECT_TRUE(registry.Has("ECHO"));
    ASSERT_NE(registry.Get("ECHO"), nullptr);
    EXPECT_EQ(registry.Get("ECHO")->GetId(), "ECHO");
}

TEST(ActionRegistryTest, NullExtensionIgnored) {
    ActionRegistry registry;
    registry.Register(nullptr);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ActionRegistryTest, ReRegisterReplacesInPlace) {
    ActionRegistry registry;
    registry.Register(std::make_unique<EchoAction>("First"));
    RegisterBuiltinActions(registry);
    registry.Register(std::make_unique<EchoAction>("Second"));

    auto ids = registry.List();
    EXPECT_EQ(ids.front(), "ECHO");
    EXPECT_EQ(std::count(ids.begin(), ids.end(), "ECHO"), 1);
    EXPECT_EQ(registry.Catalog().front().label, "Second");
}

TEST(ActionRegistryTest, CatalogFillsIdAndLabel) {
    ActionRegistry registry;
    registry.Register(std::make_unique<EchoAction>(""));
    auto catalog = registry.Catalog();
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog[0].id, "ECHO");
    EXPECT_EQ(catalog[0].label, "ECHO");
}

TEST(ActionRegistryTest, DefaultRegistryHasBuiltins) {
    auto registry = CreateDefaultActionRegistry();
    for (const char* id :
         {story::action_type::kUpdateAttribute, story::action_type::kAddItem,
          story::action_type::kRemoveItem, story::action_type::kAddClue,
          story::action_type::kRemoveClue, story::action_type::kShareClue,
          story::action_type::kOpenShop, story::action_type::kOpenCrafting,
          story::action_type::kShowToast, story::action_type::kPlaySound,
          story::action_type::kScreenShake, story::action_type::kWait,
          story::action_type::kJumpTo, story::action_type::kAdvance}) {
        EXPECT_TRUE(registry->Has(id)) << id;
    }
    EXPECT_EQ(registry->Size(), 14u);
}

TEST(ActionRegistryTest, BuiltinMetadataDescribesParams) {
    auto registry = CreateDefaultActionRegistry();
    auto meta = registry->Get(story::action_type::kUpdateAttribute)->GetMetadata();
    EXPECT_EQ(meta.label, "Update Attribute");
    ASSERT_EQ(meta.params.size(), 3u);
    EXPECT_EQ(meta.params[0].name, "attributeId");
    EXPECT_EQ(meta.params[0].type, ParamType::Entity);
    EXPECT_EQ(meta.params[1].type, ParamType::Select);
    EXPECT_EQ(meta.params[1].options.size(), 3u);
}

// ============================================================================
// Built-in handlers
// ============================================================================

class BuiltinActionTest : public ::testing::Test {
protected:
    void SetUp() override {
        story::StoryAsset asset;
        story::AttributeDefinition gold;
        gold.id = "attr_gold";
        gold.key = "gold";
        gold.defaultValue = 10.0;
        asset.attributes.push_back(gold);
        asset.items.push_back(story::Item{.id = "coin", .stackable = true});
        asset.clues.push_back(story::Clue{.id = "clue_map", .owners = {"alice"}});
        store_.init(asset);
    }

    foundation::StoryResult<ActionOutcome> run(const char* type, Params params) {
        auto* handler = registry_->Get(type);
        ActionContext ctx{store_, bus_};
        return handler->Execute(params, ctx);
    }

    bool valid(const char* type, const Params& params) {
        return registry_->Get(type)->Validate(params);
    }

    event::EventBus bus_;
    state::VariableStore store_{&bus_};
    std::unique_ptr<ActionRegistry> registry_ = CreateDefaultActionRegistry();
};

TEST_F(BuiltinActionTest, UpdateAttributeOps) {
    ASSERT_TRUE(run(story::action_type::kUpdateAttribute,
                    {{"attributeId", text("gold")}, {"op", text("add")}, {"value", Value(5.0)}})
                    .hasValue());
    EXPECT_EQ(store_.getAttribute("gold"), Value(15.0));

    ASSERT_TRUE(run(story::action_type::kUpdateAttribute,
                    {{"attributeId", text("gold")}, {"op", text("sub")}, {"value", text("3")}})
                    .hasValue());
    EXPECT_EQ(store_.getAttribute("gold"), Value(12.0));

    ASSERT_TRUE(run(story::action_type::kUpdateAttribute,
                    {{"attributeId", text("mood")}, {"value", text("calm")}})
                    .hasValue());
    EXPECT_EQ(store_.getAttribute("mood"), text("calm"));
}

TEST_F(BuiltinActionTest, UpdateAttributeValidation) {
    EXPECT_FALSE(valid(story::action_type::kUpdateAttribute, {{"op", text("add")}}));
    EXPECT_FALSE(valid(story::action_type::kUpdateAttribute,
                       {{"attributeId", text("gold")}, {"op", text("mul")}}));
    EXPECT_TRUE(valid(story::action_type::kUpdateAttribute, {{"attributeId", text("gold")}}));
}

TEST_F(BuiltinActionTest, InventoryActions) {
    EXPECT_FALSE(valid(story::action_type::kAddItem, {}));
    run(story::action_type::kAddItem, {{"itemId", text("coin")}, {"count", Value(3.0)}});
    run(story::action_type::kAddItem, {{"itemId", text("coin")}});
    EXPECT_EQ(store_.getItemCount("coin"), 4);

    run(story::action_type::kRemoveItem, {{"itemId", text("coin")}, {"count", Value(2.0)}});
    EXPECT_EQ(store_.getItemCount("coin"), 2);
}

TEST_F(BuiltinActionTest, OversizedCountsSaturate) {
    run(story::action_type::kAddItem, {{"itemId", text("coin")}, {"count", Value(1e12)}});
    EXPECT_EQ(store_.getItemCount("coin"), std::numeric_limits<int32_t>::max());

    run(story::action_type::kRemoveItem, {{"itemId", text("coin")}, {"count", Value(1e300)}});
    EXPECT_EQ(store_.getItemCount("coin"), 0);
}

TEST_F(BuiltinActionTest, ClueActions) {
    EXPECT_FALSE(valid(story::action_type::kShareClue,
                       {{"clueId", text("clue_map")}, {"fromCharacterId", text("alice")}}));

    run(story::action_type::kShareClue, {{"clueId", text("clue_map")},
                                         {"fromCharacterId", text("alice")},
                                         {"toCharacterId", text("bob")}});
    EXPECT_TRUE(store_.hasClue("clue_map", "bob"));

    run(story::action_type::kRemoveClue,
        {{"clueId", text("clue_map")}, {"characterId", text("alice")}});
    EXPECT_FALSE(store_.hasClue("clue_map", "alice"));
}

TEST_F(BuiltinActionTest, ToastPublishesMessageAndDuration) {
    std::vector<event::Toast> toasts;
    bus_.Subscribe<event::Toast>(event::topics::kToast,
                                 [&](const event::Toast& t) { toasts.push_back(t); });

    run(story::action_type::kShowToast, {{"message", text("Door unlocked")}});
    run(story::action_type::kShowToast,
        {{"message", text("Quick")}, {"duration", Value(500.0)}});

    ASSERT_EQ(toasts.size(), 2u);
    EXPECT_EQ(toasts[0].message, "Door unlocked");
    EXPECT_FALSE(toasts[0].durationMs.has_value());
    EXPECT_EQ(toasts[1].durationMs, 500);
}

TEST_F(BuiltinActionTest, ScreenShakeDefaults) {
    std::vector<event::ScreenShake> shakes;
    bus_.Subscribe<event::ScreenShake>(event::topics::kScreenShake,
                                       [&](const event::ScreenShake& s) { shakes.push_back(s); });

    run(story::action_type::kScreenShake, {});
    ASSERT_EQ(shakes.size(), 1u);
    EXPECT_EQ(shakes[0].intensity, "medium");
    EXPECT_DOUBLE_EQ(shakes[0].durationSeconds, 0.5);
}

TEST_F(BuiltinActionTest, WaitSuspendsForDuration) {
    auto twoSeconds = run(story::action_type::kWait, {{"duration", Value(2.0)}});
    ASSERT_TRUE(twoSeconds.hasValue());
    EXPECT_EQ(twoSeconds.value().suspendFor, std::chrono::milliseconds(2000));

    auto fallback = run(story::action_type::kWait, {{"duration", Value(-1.0)}});
    EXPECT_EQ(fallback.value().suspendFor, std::chrono::milliseconds(1000));
}

TEST_F(BuiltinActionTest, FlowActionsPublishRequests) {
    std::vector<std::string> jumps;
    std::vector<std::optional<std::string>> advances;
    bus_.Subscribe<event::EngineJumpTo>(
        event::topics::kEngineJumpTo,
        [&](const event::EngineJumpTo& e) { jumps.push_back(e.targetNodeId); });
    bus_.Subscribe<event::EngineAdvance>(
        event::topics::kEngineAdvance,
        [&](const event::EngineAdvance& e) { advances.push_back(e.choiceId); });

    EXPECT_FALSE(valid(story::action_type::kJumpTo, {}));
    run(story::action_type::kJumpTo, {{"targetNodeId", text("node_cellar")}});
    run(story::action_type::kAdvance, {});
    run(story::action_type::kAdvance, {{"choiceId", text("c1")}});

    EXPECT_EQ(jumps, (std::vector<std::string>{"node_cellar"}));
    ASSERT_EQ(advances.size(), 2u);
    EXPECT_FALSE(advances[0].has_value());
    EXPECT_EQ(advances[1], "c1");
}

TEST_F(BuiltinActionTest, ShopAndCraftingAndSound) {
    std::vector<std::string> seen;
    bus_.Subscribe<event::OpenShop>(event::topics::kOpenShop,
                                    [&](const event::OpenShop& e) { seen.push_back(e.shopId); });
    bus_.Subscribe(event::topics::kOpenCrafting,
                   [&](const std::any&) { seen.push_back("crafting"); });
    bus_.Subscribe<event::PlaySfx>(event::topics::kPlaySfx, [&](const event::PlaySfx& e) {
        seen.push_back(e.soundId);
        EXPECT_DOUBLE_EQ(e.volume, 1.0);
    });

    run(story::action_type::kOpenShop, {{"shopId", text("shop_1")}});
    run(story::action_type::kOpenCrafting, {});
    run(story::action_type::kPlaySound, {{"soundId", text("bell")}});

    EXPECT_EQ(seen, (std::vector<std::string>{"shop_1", "crafting", "bell"}));
}
