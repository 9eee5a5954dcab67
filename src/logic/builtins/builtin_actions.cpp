/// @file builtin_actions.cpp
/// @brief Built-in action handlers: attribute, inventory and clue
/// mutation, presentation events, WAIT and engine flow requests.

#include <cmath>

#include "nrt/event/event_bus.hpp"
#include "nrt/event/story_events.hpp"
#include "nrt/logic/action_registry.hpp"
#include "nrt/state/variable_store.hpp"
#include "nrt/story/logic_types.hpp"

namespace nrt::logic {

using foundation::StoryResult;
using story::Params;
using story::paramNumber;
using story::paramText;

namespace {

StoryResult<ActionOutcome> done() {
    return StoryResult<ActionOutcome>::ok(ActionOutcome::Done());
}

ParamConfig entityParam(std::string name, std::string label, std::string entityType) {
    return ParamConfig{.name = std::move(name),
                       .label = std::move(label),
                       .type = ParamType::Entity,
                       .entityType = std::move(entityType)};
}

ParamConfig numberParam(std::string name, std::string label, double defaultValue) {
    return ParamConfig{.name = std::move(name),
                       .label = std::move(label),
                       .type = ParamType::Number,
                       .defaultValue = defaultValue};
}

ParamConfig textParam(std::string name, std::string label, std::string placeholder = {}) {
    return ParamConfig{.name = std::move(name),
                       .label = std::move(label),
                       .type = ParamType::String,
                       .placeholder = std::move(placeholder)};
}

int32_t countParam(const Params& params) {
    double count = paramNumber(params, "count", 1.0);
    return count >= 1.0 ? story::saturateToInt32(count) : 1;
}

// -- RPG state ----------------------------------------------------------------

class UpdateAttributeAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kUpdateAttribute; }

    bool Validate(const Params& params) const override {
        if (paramText(params, "attributeId").empty()) {
            return false;
        }
        auto op = paramText(params, "op");
        return op.empty() || state::parseModifyOp(op).has_value();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        auto attributeId = paramText(params, "attributeId");
        auto opName = paramText(params, "op");
        auto op = state::parseModifyOp(opName.empty() ? "set" : opName).value_or(state::ModifyOp::Set);

        if (op == state::ModifyOp::Set) {
            const auto* value = story::findParam(params, "value");
            ctx.store.setAttribute(attributeId, value != nullptr ? *value : story::Value{});
        } else {
            ctx.store.modifyAttribute(attributeId, op, paramNumber(params, "value", 0.0));
        }
        return done();
    }

    ActionMetadata GetMetadata() const override {
        ParamConfig op{.name = "op", .label = "Operation", .type = ParamType::Select};
        op.options = {{"=", story::Value{std::string("set")}},
                      {"+", story::Value{std::string("add")}},
                      {"-", story::Value{std::string("sub")}}};
        op.defaultValue = std::string("set");
        return {.id = std::string(GetId()),
                .label = "Update Attribute",
                .category = "rpg",
                .params = {entityParam("attributeId", "Attribute", "attribute"), op,
                           numberParam("value", "Value", 0.0)}};
    }
};

class AddItemAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kAddItem; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "itemId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.store.addItem(paramText(params, "itemId"), countParam(params));
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Add Item",
                .category = "inventory",
                .params = {entityParam("itemId", "Item", "item"),
                           numberParam("count", "Count", 1.0)}};
    }
};

class RemoveItemAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kRemoveItem; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "itemId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.store.removeItem(paramText(params, "itemId"), countParam(params));
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Remove Item",
                .category = "inventory",
                .params = {entityParam("itemId", "Item", "item"),
                           numberParam("count", "Count", 1.0)}};
    }
};

class AddClueAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kAddClue; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "clueId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.store.addClue(paramText(params, "clueId"), paramText(params, "characterId"));
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Get Clue",
                .category = "knowledge",
                .params = {entityParam("characterId", "Receiver", "character"),
                           entityParam("clueId", "Clue", "clue")}};
    }
};

class RemoveClueAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kRemoveClue; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "clueId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.store.removeClue(paramText(params, "clueId"), paramText(params, "characterId"));
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Lose Clue",
                .category = "knowledge",
                .params = {entityParam("characterId", "Loser", "character"),
                           entityParam("clueId", "Clue", "clue")}};
    }
};

class ShareClueAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kShareClue; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "clueId").empty() &&
               !paramText(params, "fromCharacterId").empty() &&
               !paramText(params, "toCharacterId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.store.shareClue(paramText(params, "clueId"), paramText(params, "fromCharacterId"),
                            paramText(params, "toCharacterId"));
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Share Clue",
                .category = "knowledge",
                .params = {entityParam("fromCharacterId", "From", "character"),
                           entityParam("toCharacterId", "To", "character"),
                           entityParam("clueId", "Clue", "clue")}};
    }
};

// -- Interaction ----------------------------------------------------------------

class OpenShopAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kOpenShop; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "shopId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.bus.Publish(event::topics::kOpenShop, event::OpenShop{paramText(params, "shopId")});
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Open Shop",
                .category = "interaction",
                .params = {entityParam("shopId", "Shop", "shop")}};
    }
};

class OpenCraftingAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kOpenCrafting; }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.bus.Publish(event::topics::kOpenCrafting, event::OpenCrafting{params});
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()), .label = "Open Crafting", .category = "interaction"};
    }
};

// -- Presentation -------------------------------------------------------------

class ShowToastAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kShowToast; }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        event::Toast toast;
        toast.message = paramText(params, "message");
        double duration = paramNumber(params, "duration", std::nan(""));
        if (!std::isnan(duration)) {
            toast.durationMs = story::saturateToInt32(duration);
        }
        ctx.bus.Publish(event::topics::kToast, toast);
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Show Toast",
                .category = "presentation",
                .params = {textParam("message", "Message", "Notice text...")}};
    }
};

class PlaySoundAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kPlaySound; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "soundId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.bus.Publish(event::topics::kPlaySfx,
                        event::PlaySfx{paramText(params, "soundId"),
                                       paramNumber(params, "volume", 1.0)});
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Play Sound",
                .category = "presentation",
                .params = {textParam("soundId", "Sound ID/URL"),
                           numberParam("volume", "Volume (0-1)", 1.0)}};
    }
};

class ScreenShakeAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kScreenShake; }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        event::ScreenShake shake;
        auto intensity = paramText(params, "intensity");
        if (!intensity.empty()) {
            shake.intensity = intensity;
        }
        shake.durationSeconds = paramNumber(params, "duration", shake.durationSeconds);
        ctx.bus.Publish(event::topics::kScreenShake, shake);
        return done();
    }

    ActionMetadata GetMetadata() const override {
        ParamConfig intensity{.name = "intensity", .label = "Intensity", .type = ParamType::Select};
        intensity.options = {{"Low", story::Value{std::string("low")}},
                             {"Medium", story::Value{std::string("medium")}},
                             {"High", story::Value{std::string("high")}}};
        intensity.defaultValue = std::string("medium");
        return {.id = std::string(GetId()),
                .label = "Screen Shake",
                .category = "presentation",
                .params = {intensity, numberParam("duration", "Duration (s)", 0.5)}};
    }
};

/// Pure delay; the executor resumes the group after `duration` seconds.
class WaitAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kWait; }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& /*ctx*/) override {
        double seconds = paramNumber(params, "duration", 1.0);
        if (seconds <= 0.0) {
            seconds = 1.0;
        }
        auto ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
        return StoryResult<ActionOutcome>::ok(
            ActionOutcome::SuspendFor(std::chrono::milliseconds(ms)));
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Wait",
                .category = "presentation",
                .params = {numberParam("duration", "Duration (s)", 1.0)}};
    }
};

// -- Flow -----------------------------------------------------------------------
// Flow actions re-enter the engine through the bus, never directly.

class JumpToAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kJumpTo; }

    bool Validate(const Params& params) const override {
        return !paramText(params, "targetNodeId").empty();
    }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        ctx.bus.Publish(event::topics::kEngineJumpTo,
                        event::EngineJumpTo{paramText(params, "targetNodeId")});
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()),
                .label = "Jump To Node",
                .category = "flow",
                .params = {textParam("targetNodeId", "Target node id", "node_xxx")}};
    }
};

class AdvanceStoryAction final : public IActionExtension {
public:
    std::string_view GetId() const override { return story::action_type::kAdvance; }

    StoryResult<ActionOutcome> Execute(const Params& params, ActionContext& ctx) override {
        event::EngineAdvance request;
        auto choice = paramText(params, "choiceId");
        if (!choice.empty()) {
            request.choiceId = std::move(choice);
        }
        ctx.bus.Publish(event::topics::kEngineAdvance, request);
        return done();
    }

    ActionMetadata GetMetadata() const override {
        return {.id = std::string(GetId()), .label = "Advance", .category = "flow"};
    }
};

} // namespace

void RegisterBuiltinActions(ActionRegistry& registry) {
    registry.Register(std::make_unique<UpdateAttributeAction>());
    registry.Register(std::make_unique<AddItemAction>());
    registry.Register(std::make_unique<RemoveItemAction>());
    registry.Register(std::make_unique<AddClueAction>());
    registry.Register(std::make_unique<RemoveClueAction>());
    registry.Register(std::make_unique<ShareClueAction>());
    registry.Register(std::make_unique<OpenShopAction>());
    registry.Register(std::make_unique<OpenCraftingAction>());
    registry.Register(std::make_unique<ShowToastAction>());
    registry.Register(std::make_unique<PlaySoundAction>());
    registry.Register(std::make_unique<ScreenShakeAction>());
    registry.Register(std::make_unique<WaitAction>());
    registry.Register(std::make_unique<AdvanceStoryAction>());
    registry.Register(std::make_unique<JumpToAction>());
}

} // namespace nrt::logic
