#pragma once

/// @file narrative_engine.hpp
/// @brief Node-graph interpreter: loads a story, enters segments, follows
/// guarded edges and resolves event-triggered action/navigation chains.

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "nrt/engine/engine_config.hpp"
#include "nrt/event/event_bus.hpp"
#include "nrt/foundation/story_result.hpp"
#include "nrt/story/story_types.hpp"

namespace nrt::state {
class VariableStore;
}

namespace nrt::logic {
class ActionExecutor;
class ConditionEngine;
}

namespace nrt::scene {
class SceneGraph;
}

namespace nrt::engine {

/// Interprets one story at a time.
///
/// States: unloaded (no story) and segment-active (a current node is set
/// inside a loaded segment). Control nodes run automatically on entry:
/// START and BRANCH advance at once, ACTION runs its actions and then
/// follows an unconditioned edge or falls back to the last LOCATION.
/// DIALOGUE, LOCATION, VOTE and JUMP wait for advance() or
/// triggerEvent().
///
/// Calls are serialised: engine:advance / engine:jumpTo requests that
/// arrive on the bus while an operation is running are queued and run,
/// in order, once the outermost operation returns.
///
/// Normal narrative outcomes (missing node, unmet guard, absent choice,
/// dead end) are logged and reported through null returns, never thrown.
class NarrativeEngine {
public:
    NarrativeEngine(state::VariableStore& store, event::EventBus& bus,
                    logic::ActionExecutor& executor, logic::ConditionEngine& conditions,
                    scene::SceneGraph& scene, EngineConfig config = {});
    ~NarrativeEngine();

    NarrativeEngine(const NarrativeEngine&) = delete;
    NarrativeEngine& operator=(const NarrativeEngine&) = delete;

    /// Take a snapshot of @p story, reseed the store and drop pending
    /// continuations of the previous story.
    void loadStory(story::StoryAsset story);

    /// Enter the segment's root node (or its first node when the root is
    /// missing). Null when no story is loaded or the id is unknown.
    const story::NarrativeNode* startSegment(std::string_view segmentId);

    /// Follow the first viable outgoing edge of the current node.
    ///
    /// A DIALOGUE node with choices needs @p choiceId; without it the
    /// current node is returned unchanged. When no edge qualifies,
    /// story:end is published and null returned.
    const story::NarrativeNode* advance(std::optional<std::string> choiceId = std::nullopt);

    /// Fire the current node's events matching @p trigger (and
    /// @p targetId when given).
    void triggerEvent(std::string_view trigger,
                      std::optional<std::string> targetId = std::nullopt);

    /// Fast-forward through ACTION and BRANCH nodes starting at @p nodeId
    /// until a content node is entered.
    /// @return NavigationCycle when a node repeats or the depth limit is hit.
    foundation::StoryResult<void> resolveNavigationFromNode(std::string_view nodeId);

    /// Enter @p nodeId directly, bypassing edge guards. Null when the node
    /// is not part of the current segment.
    const story::NarrativeNode* jumpToNode(std::string_view nodeId);

    [[nodiscard]] const story::NarrativeNode* getCurrentNode() const;

    [[nodiscard]] bool isLoaded() const noexcept { return story_.has_value(); }

    [[nodiscard]] const story::StoryAsset* story() const noexcept {
        return story_ ? &*story_ : nullptr;
    }

    [[nodiscard]] const story::SegmentAsset* currentSegment() const noexcept { return segment_; }

    /// Last LOCATION node entered in the current segment.
    [[nodiscard]] const std::optional<std::string>& lastLocationId() const noexcept {
        return lastLocationId_;
    }

    [[nodiscard]] std::size_t queuedRequests() const noexcept { return requests_.size(); }

private:
    struct ResolvePass {
        std::set<std::string> visited;
        std::size_t depth = 0;
        uint64_t epoch = 0;
    };

    template <typename Fn>
    const story::NarrativeNode* serialized(Fn&& fn);

    void drainRequests();

    void onAdvanceRequest(const std::any& payload);
    void onJumpRequest(const std::any& payload);

    const story::NarrativeNode* startSegmentImpl(std::string_view segmentId);
    const story::NarrativeNode* advanceImpl(const std::optional<std::string>& choiceId);
    void triggerEventImpl(std::string_view trigger, const std::optional<std::string>& targetId);
    const story::NarrativeNode* jumpToNodeImpl(std::string_view nodeId);

    /// Exit the current node and enter @p nodeId, then run its automatic
    /// behaviour.
    const story::NarrativeNode* setCurrentNode(std::string_view nodeId);

    /// onExit events and node:exit for the current node.
    void exitCurrentNode();

    void runAutoBehaviour(const story::NarrativeNode& node, uint64_t epoch);

    /// Post-step of an ACTION node entered through setCurrentNode().
    void finishActionNode(const std::string& nodeId, uint64_t epoch);

    /// Edge advance() would take, or nullptr.
    const story::Edge* selectEdge(const story::NarrativeNode& node,
                                  const std::optional<std::string>& choiceId) const;

    /// Guard of @p edge when leaving BRANCH node @p branch.
    bool branchEdgePasses(const story::NarrativeNode& branch, const story::Edge& edge) const;

    /// First outgoing edge whose own guard passes.
    const story::Edge* firstPassingEdge(const std::string& nodeId) const;

    foundation::StoryResult<void> resolveStep(const std::string& nodeId, ResolvePass pass);

    void endStory();

    void notifyDeadEnd(const std::string& message);

    const story::NarrativeNode* findNode(std::string_view nodeId) const;

    state::VariableStore& store_;
    event::EventBus& bus_;
    logic::ActionExecutor& executor_;
    logic::ConditionEngine& conditions_;
    scene::SceneGraph& scene_;
    EngineConfig config_;

    std::optional<story::StoryAsset> story_;
    const story::SegmentAsset* segment_ = nullptr;
    std::optional<std::string> currentNodeId_;
    std::optional<std::string> lastLocationId_;

    /// Bumped on every change of the current node; continuations scheduled
    /// under an older epoch do not navigate.
    uint64_t epoch_ = 0;
    std::size_t busyDepth_ = 0;
    std::size_t autoDepth_ = 0;
    bool exiting_ = false;
    std::deque<std::function<void()>> requests_;

    event::SubscriptionId advanceSub_ = 0;
    event::SubscriptionId jumpSub_ = 0;
};

} // namespace nrt::engine
