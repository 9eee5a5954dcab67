#pragma once

/// @file action_extension.hpp
/// @brief IActionExtension interface implemented by every action handler.

#include <chrono>
#include <string>
#include <string_view>

#include "nrt/foundation/story_result.hpp"
#include "nrt/logic/extension_types.hpp"
#include "nrt/story/value.hpp"

namespace nrt::event {
class EventBus;
}

namespace nrt::state {
class VariableStore;
}

namespace nrt::logic {

/// Collaborators handed to a handler for one execution.
struct ActionContext {
    state::VariableStore& store;
    event::EventBus& bus;
    std::string scope = "global";
};

/// What a handler asks of the executor once it returns successfully.
///
/// A non-zero suspension makes the executor wait that long on the timer
/// queue before the next action of the group runs.
struct ActionOutcome {
    std::chrono::milliseconds suspendFor{0};

    static ActionOutcome Done() { return {}; }

    static ActionOutcome SuspendFor(std::chrono::milliseconds duration) {
        return ActionOutcome{duration};
    }

    [[nodiscard]] bool Suspends() const noexcept { return suspendFor.count() > 0; }
};

/// Abstract base for action handlers.
///
/// Handlers are looked up by GetId() in the ActionRegistry. They report
/// failure through the returned StoryResult; an exception escaping
/// Execute() is converted to ActionFailed by the executor.
class IActionExtension {
public:
    virtual ~IActionExtension() = default;

    /// Stable type id, e.g. "ADD_ITEM".
    [[nodiscard]] virtual std::string_view GetId() const = 0;

    /// Reject malformed parameters. Rejected actions are skipped with a
    /// warning.
    [[nodiscard]] virtual bool Validate(const story::Params& /*params*/) const { return true; }

    virtual foundation::StoryResult<ActionOutcome> Execute(const story::Params& params,
                                                           ActionContext& ctx) = 0;

    /// Catalog entry; defaults to the bare id.
    [[nodiscard]] virtual ActionMetadata GetMetadata() const {
        ActionMetadata meta;
        meta.id = std::string(GetId());
        meta.label = meta.id;
        return meta;
    }
};

} // namespace nrt::logic
