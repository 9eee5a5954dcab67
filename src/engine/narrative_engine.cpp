/// @file narrative_engine.cpp
/// @brief NarrativeEngine implementation.

#include "nrt/engine/narrative_engine.hpp"

#include <algorithm>
#include <any>
#include <memory>

#include "nrt/event/story_events.hpp"
#include "nrt/foundation/runtime_logger.hpp"
#include "nrt/logic/action_executor.hpp"
#include "nrt/logic/condition_engine.hpp"
#include "nrt/scene/scene_graph.hpp"
#include "nrt/state/variable_store.hpp"

namespace nrt::engine {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RuntimeLogger;
using foundation::StoryError;
using foundation::StoryResult;
using story::NarrativeNode;
using story::NodeType;

namespace {

void logNode(LogLevel level, const story::SegmentAsset* segment, std::string_view nodeId,
             std::string_view msg) {
    auto& logger = RuntimeLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Engine)) {
        return;
    }
    LogContext ctx;
    if (segment != nullptr) {
        ctx.segmentId = segment->id;
    }
    if (!nodeId.empty()) {
        ctx.nodeId = std::string(nodeId);
    }
    logger.logWithContext(level, LogCategory::Engine, msg, ctx);
}

} // namespace

NarrativeEngine::NarrativeEngine(state::VariableStore& store, event::EventBus& bus,
                                 logic::ActionExecutor& executor,
                                 logic::ConditionEngine& conditions, scene::SceneGraph& scene,
                                 EngineConfig config)
    : store_(store),
      bus_(bus),
      executor_(executor),
      conditions_(conditions),
      scene_(scene),
      config_(std::move(config)) {
    advanceSub_ = bus_.Subscribe(event::topics::kEngineAdvance,
                                 [this](const std::any& payload) { onAdvanceRequest(payload); });
    jumpSub_ = bus_.Subscribe(event::topics::kEngineJumpTo,
                              [this](const std::any& payload) { onJumpRequest(payload); });
}

NarrativeEngine::~NarrativeEngine() {
    bus_.Unsubscribe(advanceSub_);
    bus_.Unsubscribe(jumpSub_);
}

// -- Serialisation ------------------------------------------------------------

template <typename Fn>
const NarrativeNode* NarrativeEngine::serialized(Fn&& fn) {
    ++busyDepth_;
    const NarrativeNode* result = fn();
    --busyDepth_;

    if (busyDepth_ == 0 && !requests_.empty()) {
        drainRequests();
        return getCurrentNode();
    }
    return result;
}

void NarrativeEngine::drainRequests() {
    ++busyDepth_;
    while (!requests_.empty()) {
        auto request = std::move(requests_.front());
        requests_.pop_front();
        request();
    }
    --busyDepth_;
}

void NarrativeEngine::onAdvanceRequest(const std::any& payload) {
    std::optional<std::string> choiceId;
    if (const auto* request = std::any_cast<event::EngineAdvance>(&payload)) {
        choiceId = request->choiceId;
    }

    if (busyDepth_ > 0) {
        // Stale once the engine has moved past the node that asked.
        requests_.push_back([this, choiceId, epoch = epoch_] {
            if (epoch != epoch_) {
                logNode(LogLevel::Debug, segment_, currentNodeId_.value_or(""),
                        "Queued advance dropped: the flow already moved on");
                return;
            }
            advanceImpl(choiceId);
        });
        return;
    }
    advance(choiceId);
}

void NarrativeEngine::onJumpRequest(const std::any& payload) {
    std::string target;
    if (const auto* request = std::any_cast<event::EngineJumpTo>(&payload)) {
        target = request->targetNodeId;
    } else if (const auto* id = std::any_cast<std::string>(&payload)) {
        target = *id;
    }
    if (target.empty()) {
        NRT_LOG_WARN(LogCategory::Engine, "engine:jumpTo without a target node id");
        return;
    }

    if (busyDepth_ > 0) {
        requests_.push_back([this, target] { jumpToNodeImpl(target); });
        return;
    }
    jumpToNode(target);
}

// -- Public API -----------------------------------------------------------------

void NarrativeEngine::loadStory(story::StoryAsset story) {
    serialized([&]() -> const NarrativeNode* {
        executor_.InvalidatePending();
        requests_.clear();
        ++epoch_;

        story_ = std::move(story);
        segment_ = nullptr;
        currentNodeId_.reset();
        lastLocationId_.reset();
        scene_.clear();

        store_.init(*story_);
        bus_.Publish(event::topics::kStoryLoaded, event::StoryLoaded{story_->id, story_->title});
        NRT_LOG_INFO(LogCategory::Engine, "Story loaded: " + story_->title);
        return nullptr;
    });
}

const NarrativeNode* NarrativeEngine::startSegment(std::string_view segmentId) {
    return serialized([&] { return startSegmentImpl(segmentId); });
}

const NarrativeNode* NarrativeEngine::advance(std::optional<std::string> choiceId) {
    return serialized([&] { return advanceImpl(choiceId); });
}

void NarrativeEngine::triggerEvent(std::string_view trigger, std::optional<std::string> targetId) {
    serialized([&]() -> const NarrativeNode* {
        triggerEventImpl(trigger, targetId);
        return nullptr;
    });
}

StoryResult<void> NarrativeEngine::resolveNavigationFromNode(std::string_view nodeId) {
    auto result = StoryResult<void>::ok();
    serialized([&]() -> const NarrativeNode* {
        ResolvePass pass;
        pass.epoch = epoch_;
        result = resolveStep(std::string(nodeId), std::move(pass));
        return nullptr;
    });
    return result;
}

const NarrativeNode* NarrativeEngine::jumpToNode(std::string_view nodeId) {
    return serialized([&] { return jumpToNodeImpl(nodeId); });
}

const NarrativeNode* NarrativeEngine::getCurrentNode() const {
    return currentNodeId_ ? findNode(*currentNodeId_) : nullptr;
}

// -- Operations -----------------------------------------------------------------

const NarrativeNode* NarrativeEngine::startSegmentImpl(std::string_view segmentId) {
    if (!story_) {
        NRT_LOG_ERROR(LogCategory::Engine, "No story loaded");
        return nullptr;
    }
    const auto* segment = story::findSegment(*story_, segmentId);
    if (segment == nullptr) {
        NRT_LOG_ERROR(LogCategory::Engine, "Segment not found: " + std::string(segmentId));
        return nullptr;
    }

    if (currentNodeId_) {
        exitCurrentNode();
    }
    segment_ = segment;
    currentNodeId_.reset();
    lastLocationId_.reset();
    ++epoch_;

    for (const auto& problem : story::findSegmentProblems(*segment)) {
        logNode(LogLevel::Warning, segment_, {}, problem);
    }

    scene_.loadSegment(*segment);
    bus_.Publish(event::topics::kSegmentStarted, event::SegmentStarted{segment->id, segment->name});

    std::string startId = segment->rootNodeId;
    if (startId.empty() || !segment->nodes.contains(startId)) {
        if (segment->nodes.empty()) {
            logNode(LogLevel::Warning, segment_, {}, "Segment has no nodes");
            return nullptr;
        }
        startId = segment->nodes.begin()->first;
    }
    return setCurrentNode(startId);
}

const NarrativeNode* NarrativeEngine::advanceImpl(const std::optional<std::string>& choiceId) {
    const auto* node = getCurrentNode();
    if (node == nullptr) {
        return nullptr;
    }

    if (const auto* dialogue = node->as<story::DialogueBody>();
        dialogue != nullptr && !dialogue->choices.empty() && !choiceId) {
        logNode(LogLevel::Warning, segment_, node->id, "Dialogue node requires a choice to advance");
        return node;
    }

    if (const auto* edge = selectEdge(*node, choiceId)) {
        logNode(LogLevel::Debug, segment_, node->id, "Advancing via edge " + edge->id);
        return setCurrentNode(edge->targetNodeId);
    }

    if (const auto* jump = node->as<story::JumpBody>();
        jump != nullptr && !jump->targetSegmentId.empty() &&
        story::findSegment(*story_, jump->targetSegmentId) != nullptr) {
        logNode(LogLevel::Debug, segment_, node->id, "Jumping to segment " + jump->targetSegmentId);
        return startSegmentImpl(jump->targetSegmentId);
    }

    notifyDeadEnd("End of path reached");
    endStory();
    return nullptr;
}

void NarrativeEngine::triggerEventImpl(std::string_view trigger,
                                       const std::optional<std::string>& targetId) {
    const auto* node = getCurrentNode();
    if (node == nullptr) {
        return;
    }

    // Copies: handlers may navigate away from the node while we iterate.
    std::string nodeId = node->id;
    std::vector<story::NodeEvent> matching;
    for (const auto& evt : node->events) {
        if (evt.trigger != trigger) {
            continue;
        }
        if (targetId && evt.targetId != targetId) {
            continue;
        }
        matching.push_back(evt);
    }

    for (const auto& evt : matching) {
        if (!conditions_.evaluate(evt.condition)) {
            logNode(LogLevel::Debug, segment_, nodeId, "Event guard failed: " + evt.label);
            continue;
        }

        if (!evt.actions.empty()) {
            executor_.ExecuteGroup(evt.actions, [this, nodeId](StoryResult<void> result) {
                if (result.hasError() && result.error().code() != ErrorCode::ActionCancelled) {
                    logNode(LogLevel::Error, segment_, nodeId,
                            "Event actions failed: " + std::string(result.error().message()));
                }
            });
        }

        std::vector<const story::Edge*> actionEdges;
        std::vector<const story::Edge*> navigationEdges;
        for (const auto* edge : story::outgoingEdges(*segment_, nodeId)) {
            if (edge->sourceHandleId != evt.id) {
                continue;
            }
            const auto* target = findNode(edge->targetNodeId);
            if (target != nullptr && target->type() == NodeType::Action) {
                actionEdges.push_back(edge);
            } else {
                navigationEdges.push_back(edge);
            }
        }

        if (actionEdges.empty() && navigationEdges.empty()) {
            if (evt.actions.empty()) {
                notifyDeadEnd("Nothing is wired to '" +
                              (evt.label.empty() ? evt.id : evt.label) + "'");
            }
            continue;
        }

        for (const auto* edge : actionEdges) {
            if (!conditions_.evaluate(edge->condition)) {
                continue;
            }
            ResolvePass pass;
            pass.epoch = epoch_;
            auto result = resolveStep(edge->targetNodeId, std::move(pass));
            if (result.hasError()) {
                logNode(LogLevel::Error, segment_, edge->targetNodeId,
                        std::string(result.error().message()));
            }
        }

        for (const auto* edge : navigationEdges) {
            if (conditions_.evaluate(edge->condition)) {
                setCurrentNode(edge->targetNodeId);
                break;
            }
        }
    }
}

const NarrativeNode* NarrativeEngine::jumpToNodeImpl(std::string_view nodeId) {
    if (segment_ == nullptr || findNode(nodeId) == nullptr) {
        logNode(LogLevel::Error, segment_, nodeId, "Cannot jump to node");
        return nullptr;
    }
    return setCurrentNode(nodeId);
}

// -- Node entry -------------------------------------------------------------------

const NarrativeNode* NarrativeEngine::setCurrentNode(std::string_view nodeId) {
    const auto* node = findNode(nodeId);
    if (node == nullptr) {
        logNode(LogLevel::Error, segment_, nodeId, "Node not found");
        return nullptr;
    }
    if (exiting_) {
        logNode(LogLevel::Debug, segment_, nodeId, "Navigation during onExit ignored");
        return getCurrentNode();
    }

    if (currentNodeId_) {
        exitCurrentNode();
    }

    currentNodeId_ = node->id;
    auto epoch = ++epoch_;
    if (node->type() == NodeType::Location) {
        lastLocationId_ = node->id;
    }

    bus_.Publish(event::topics::kNodeEnter, event::NodeEnter{node->id, node->type(), *node});
    scene_.selectNode(node->id);

    triggerEventImpl(story::trigger::kOnEnter, std::nullopt);
    if (epoch_ != epoch) {
        // An onEnter handler already moved on.
        return getCurrentNode();
    }

    runAutoBehaviour(*node, epoch);
    return getCurrentNode();
}

void NarrativeEngine::exitCurrentNode() {
    std::string previous = *currentNodeId_;
    exiting_ = true;
    triggerEventImpl(story::trigger::kOnExit, std::nullopt);
    exiting_ = false;
    bus_.Publish(event::topics::kNodeExit, event::NodeExit{previous});
}

void NarrativeEngine::runAutoBehaviour(const NarrativeNode& node, uint64_t epoch) {
    auto type = node.type();
    if (type != NodeType::Start && type != NodeType::Branch && type != NodeType::Action) {
        return;
    }

    if (autoDepth_ >= config_.maxResolutionDepth) {
        logNode(LogLevel::Error, segment_, node.id,
                "Automatic advance stopped: depth limit reached (possible cycle)");
        return;
    }

    ++autoDepth_;
    if (type == NodeType::Action) {
        std::string nodeId = node.id;
        executor_.ExecuteGroup(node.as<story::ActionBody>()->actions,
                               [this, nodeId, epoch](StoryResult<void> result) {
                                   if (result.hasError()) {
                                       if (result.error().code() == ErrorCode::ActionCancelled) {
                                           return;
                                       }
                                       logNode(LogLevel::Error, segment_, nodeId,
                                               std::string(result.error().message()));
                                   }
                                   if (busyDepth_ > 0) {
                                       finishActionNode(nodeId, epoch);
                                       return;
                                   }
                                   serialized([&]() -> const NarrativeNode* {
                                       finishActionNode(nodeId, epoch);
                                       return nullptr;
                                   });
                               });
    } else {
        advanceImpl(std::nullopt);
    }
    --autoDepth_;
}

void NarrativeEngine::finishActionNode(const std::string& nodeId, uint64_t epoch) {
    if (epoch != epoch_) {
        logNode(LogLevel::Debug, segment_, nodeId, "Action node left before its actions finished");
        return;
    }

    for (const auto* edge : story::outgoingEdges(*segment_, nodeId)) {
        if (!edge->condition) {
            setCurrentNode(edge->targetNodeId);
            return;
        }
    }

    if (lastLocationId_ && *lastLocationId_ != nodeId) {
        logNode(LogLevel::Debug, segment_, nodeId, "Returning to location " + *lastLocationId_);
        currentNodeId_ = lastLocationId_;
        ++epoch_;
        scene_.selectNode(*lastLocationId_);
    }
}

// -- Edge selection ---------------------------------------------------------------

const story::Edge* NarrativeEngine::selectEdge(const NarrativeNode& node,
                                               const std::optional<std::string>& choiceId) const {
    auto edges = story::outgoingEdges(*segment_, node.id);

    const auto* dialogue = node.as<story::DialogueBody>();
    bool byChoice = (dialogue != nullptr && !dialogue->choices.empty()) ||
                    (node.type() == NodeType::Vote && choiceId.has_value());
    if (byChoice) {
        auto it = std::find_if(edges.begin(), edges.end(), [&](const story::Edge* e) {
            return e->sourceHandleId == choiceId;
        });
        return it == edges.end() ? nullptr : *it;
    }

    if (node.type() == NodeType::Branch) {
        for (const auto* edge : edges) {
            if (branchEdgePasses(node, *edge)) {
                return edge;
            }
        }
        return nullptr;
    }

    for (const auto* edge : edges) {
        if (!edge->sourceHandleId && conditions_.evaluate(edge->condition)) {
            return edge;
        }
    }
    return nullptr;
}

bool NarrativeEngine::branchEdgePasses(const NarrativeNode& branch, const story::Edge& edge) const {
    if (edge.condition) {
        return conditions_.evaluate(*edge.condition);
    }
    if (!edge.sourceHandleId) {
        return true;
    }

    const auto& conditions = branch.as<story::BranchBody>()->conditions;
    auto it = std::find_if(conditions.begin(), conditions.end(),
                           [&](const story::BranchCondition& c) {
                               return c.id == *edge.sourceHandleId;
                           });
    if (it == conditions.end()) {
        // Unmatched handle: the implicit else.
        return true;
    }

    if (const auto* cmp = std::get_if<story::AttributeComparison>(&it->test)) {
        return story::compareValues(store_.getAttribute(cmp->attributeId), cmp->value, cmp->op);
    }
    return conditions_.evaluate(std::get<story::ConditionNode>(it->test));
}

const story::Edge* NarrativeEngine::firstPassingEdge(const std::string& nodeId) const {
    for (const auto* edge : story::outgoingEdges(*segment_, nodeId)) {
        if (conditions_.evaluate(edge->condition)) {
            return edge;
        }
    }
    return nullptr;
}

// -- Chain resolution -------------------------------------------------------------

StoryResult<void> NarrativeEngine::resolveStep(const std::string& nodeId, ResolvePass pass) {
    if (segment_ == nullptr) {
        return StoryResult<void>::err(StoryError(ErrorCode::StoryNotLoaded, "no active segment"));
    }
    const auto* node = findNode(nodeId);
    if (node == nullptr) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::NodeNotFound, "node not found: " + nodeId, nodeId));
    }
    if (pass.visited.contains(nodeId) || pass.depth >= config_.maxResolutionDepth) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::NavigationCycle,
                       "navigation cycle detected at node " + nodeId, nodeId));
    }
    pass.visited.insert(nodeId);
    ++pass.depth;

    switch (node->type()) {
        case NodeType::Action: {
            auto outcome = std::make_shared<StoryResult<void>>(StoryResult<void>::ok());
            auto state = executor_.ExecuteGroup(
                node->as<story::ActionBody>()->actions,
                [this, nodeId, pass, outcome](StoryResult<void> result) mutable {
                    if (result.hasError()) {
                        if (result.error().code() == ErrorCode::ActionCancelled) {
                            return;
                        }
                        logNode(LogLevel::Error, segment_, nodeId,
                                std::string(result.error().message()));
                    }
                    auto follow = [&]() -> StoryResult<void> {
                        if (pass.epoch != epoch_) {
                            logNode(LogLevel::Debug, segment_, nodeId,
                                    "Chain abandoned: player moved on");
                            return StoryResult<void>::ok();
                        }
                        const auto* edge = firstPassingEdge(nodeId);
                        if (edge == nullptr) {
                            return StoryResult<void>::ok();
                        }
                        return resolveStep(edge->targetNodeId, pass);
                    };
                    if (busyDepth_ > 0) {
                        *outcome = follow();
                        return;
                    }
                    serialized([&]() -> const NarrativeNode* {
                        *outcome = follow();
                        if (outcome->hasError()) {
                            logNode(LogLevel::Error, segment_, nodeId,
                                    std::string(outcome->error().message()));
                        }
                        return nullptr;
                    });
                });
            if (state == logic::ActionExecutor::GroupState::Pending) {
                return StoryResult<void>::ok();
            }
            return *outcome;
        }

        case NodeType::Branch: {
            const auto& edges = story::outgoingEdges(*segment_, nodeId);
            for (const auto* edge : edges) {
                if (branchEdgePasses(*node, *edge)) {
                    return resolveStep(edge->targetNodeId, std::move(pass));
                }
            }
            notifyDeadEnd("Branch '" + node->name + "' has no viable edge");
            endStory();
            return StoryResult<void>::ok();
        }

        default:
            setCurrentNode(nodeId);
            return StoryResult<void>::ok();
    }
}

// -- Helpers ----------------------------------------------------------------------

void NarrativeEngine::endStory() {
    bus_.Publish(event::topics::kStoryEnd,
                 event::StoryEnd{segment_ != nullptr ? segment_->id : std::string{}});
}

void NarrativeEngine::notifyDeadEnd(const std::string& message) {
    logNode(LogLevel::Warning, segment_, currentNodeId_.value_or(""), message);
    if (!config_.deadEndToast) {
        return;
    }
    event::Toast toast;
    toast.message = message;
    toast.durationMs = static_cast<int32_t>(config_.toastDuration.count());
    bus_.Publish(event::topics::kToast, toast);
}

const NarrativeNode* NarrativeEngine::findNode(std::string_view nodeId) const {
    return segment_ != nullptr ? story::findNode(*segment_, nodeId) : nullptr;
}

} // namespace nrt::engine
