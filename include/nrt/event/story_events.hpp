#pragma once

/// @file story_events.hpp
/// @brief Topic names and payloads published on the EventBus by the
/// runtime, plus the request topics the engine consumes.

#include <cstdint>
#include <optional>
#include <string>

#include "nrt/story/story_types.hpp"
#include "nrt/story/value.hpp"

namespace nrt::event {

namespace topics {
// Lifecycle
inline constexpr const char* kStoryLoaded = "story:loaded";
inline constexpr const char* kSegmentStarted = "segment:started";
inline constexpr const char* kNodeEnter = "node:enter";
inline constexpr const char* kNodeExit = "node:exit";
inline constexpr const char* kStoryEnd = "story:end";

// State
inline constexpr const char* kAttributeChanged = "attribute:changed";
inline constexpr const char* kInventoryAdded = "inventory:added";
inline constexpr const char* kInventoryRemoved = "inventory:removed";
inline constexpr const char* kClueRevealed = "clue:revealed";
inline constexpr const char* kClueObtained = "clue:obtained";
inline constexpr const char* kClueLost = "clue:lost";
inline constexpr const char* kClueShared = "clue:shared";

// Presentation
inline constexpr const char* kToast = "ui:toast";
inline constexpr const char* kOpenShop = "ui:openShop";
inline constexpr const char* kOpenCrafting = "ui:openCrafting";
inline constexpr const char* kScreenShake = "ui:shake";
inline constexpr const char* kPlaySfx = "audio:playSfx";

// Requests consumed by the engine
inline constexpr const char* kEngineAdvance = "engine:advance";
inline constexpr const char* kEngineJumpTo = "engine:jumpTo";
} // namespace topics

struct StoryLoaded {
    std::string storyId;
    std::string title;
};

struct SegmentStarted {
    std::string segmentId;
    std::string name;
};

/// Carries a copy of the node so subscribers never hold pointers into
/// the engine's story snapshot.
struct NodeEnter {
    std::string nodeId;
    story::NodeType type = story::NodeType::Start;
    story::NarrativeNode node;
};

struct NodeExit {
    std::string nodeId;
};

struct StoryEnd {
    std::string segmentId;
};

struct AttributeChanged {
    std::string id;
    std::string key;
    story::Value value;
    story::Value oldValue;
};

/// Payload of both inventory:added and inventory:removed.
struct InventoryChanged {
    std::string itemId;
    int32_t count = 0;
    int32_t total = 0;
};

struct ClueRevealed {
    std::string clueId;
};

/// Payload of clue:obtained and clue:lost.
struct ClueOwnership {
    std::string clueId;
    std::string characterId;
};

struct ClueShared {
    std::string clueId;
    std::string fromCharacterId;
    std::string toCharacterId;
};

struct Toast {
    std::string message;
    std::optional<int32_t> durationMs;
};

struct OpenShop {
    std::string shopId;
};

/// Forwards the action's parameters untouched (recipe filter, station id).
struct OpenCrafting {
    story::Params params;
};

struct ScreenShake {
    std::string intensity = "medium"; ///< low / medium / high
    double durationSeconds = 0.5;
};

struct PlaySfx {
    std::string soundId;
    double volume = 1.0;
};

struct EngineAdvance {
    std::optional<std::string> choiceId;
};

struct EngineJumpTo {
    std::string targetNodeId;
};

} // namespace nrt::event
