#pragma once

/// @file story_types.hpp
/// @brief Story document model: segments of typed nodes joined by guarded
/// edges, plus the RPG definitions (attributes, items, clues, shops).
///
/// The document is plain data. It is built by DocumentFactory, changed only
/// through commands on the CommandBus, and handed to the NarrativeEngine as
/// an immutable snapshot.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "nrt/story/logic_types.hpp"
#include "nrt/story/value.hpp"

namespace nrt::story {

struct Vector2 {
    double x = 0.0;
    double y = 0.0;
    bool operator==(const Vector2&) const = default;
};

// -- Node events (ECA) --------------------------------------------------------

/// Standard trigger names.
namespace trigger {
inline constexpr const char* kOnEnter = "onEnter";
inline constexpr const char* kOnExit = "onExit";
inline constexpr const char* kOnClick = "onClick";
} // namespace trigger

/// Event-Condition-Action entry attached to a node.
///
/// Edges whose sourceHandleId equals the event id are the event's
/// handlers; `actions` run inline before them.
struct NodeEvent {
    std::string id;
    std::string trigger;                 ///< onEnter / onExit / onClick / custom
    std::string label;                   ///< Diagnostics only.
    std::optional<std::string> targetId; ///< Hotspot or choice id.
    std::optional<Guard> condition;
    std::vector<ActionSpec> actions;

    bool operator==(const NodeEvent&) const = default;
};

// -- Node bodies --------------------------------------------------------------

enum class NodeType : uint8_t { Start, Location, Dialogue, Branch, Action, Jump, Vote };

[[nodiscard]] std::string_view nodeTypeName(NodeType type);

struct Hotspot {
    std::string id;
    std::string name;
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    std::string image;
    bool operator==(const Hotspot&) const = default;
};

struct DialogueChoice {
    std::string id;
    std::string text;
    bool operator==(const DialogueChoice&) const = default;
};

enum class Placement : uint8_t { Left, Center, Right };

struct StartBody {
    bool operator==(const StartBody&) const = default;
};

struct LocationBody {
    std::string backgroundImage;
    std::vector<Hotspot> hotspots;
    std::string bgm;
    std::string filter;
    bool operator==(const LocationBody&) const = default;
};

struct DialogueBody {
    std::string characterId;
    std::string text;
    std::vector<DialogueChoice> choices;
    std::string voiceId;
    std::string expression;
    Placement placement = Placement::Center;
    bool operator==(const DialogueBody&) const = default;
};

/// `attribute <op> value`, the classic branch test.
struct AttributeComparison {
    std::string attributeId;
    CompareOp op = CompareOp::Equal;
    Value value;
    bool operator==(const AttributeComparison&) const = default;
};

/// One output of a branch node; `id` is the handle id edges refer to.
struct BranchCondition {
    std::string id;
    std::variant<AttributeComparison, ConditionNode> test;
    bool operator==(const BranchCondition&) const = default;
};

struct BranchBody {
    std::vector<BranchCondition> conditions;
    bool operator==(const BranchBody&) const = default;
};

struct ActionBody {
    std::vector<ActionSpec> actions;
    bool operator==(const ActionBody&) const = default;
};

struct JumpBody {
    std::string targetSegmentId;
    bool operator==(const JumpBody&) const = default;
};

enum class VoteStrategy : uint8_t { Majority, Score, Branch };

struct VoteOption {
    std::string id;
    std::string text;
    bool isCorrect = false;
    double score = 0.0;
    bool operator==(const VoteOption&) const = default;
};

struct VoteBody {
    std::string title;
    double durationSeconds = 30.0;
    std::vector<VoteOption> options;
    VoteStrategy strategy = VoteStrategy::Majority;
    bool operator==(const VoteBody&) const = default;
};

/// Alternative order matches NodeType.
using NodeBody = std::variant<StartBody, LocationBody, DialogueBody, BranchBody,
                              ActionBody, JumpBody, VoteBody>;

/// A typed narrative unit.
struct NarrativeNode {
    std::string id;
    std::string name;
    Vector2 position;
    Vector2 size{300.0, 200.0};
    std::optional<std::string> parentId;
    std::vector<NodeEvent> events;
    NodeBody body;

    [[nodiscard]] NodeType type() const noexcept {
        return static_cast<NodeType>(body.index());
    }

    template <typename Body>
    [[nodiscard]] const Body* as() const noexcept {
        return std::get_if<Body>(&body);
    }

    template <typename Body>
    [[nodiscard]] Body* as() noexcept {
        return std::get_if<Body>(&body);
    }

    bool operator==(const NarrativeNode&) const = default;
};

/// Directed transition between two nodes of a segment.
struct Edge {
    std::string id;
    std::string sourceNodeId;
    std::string targetNodeId;
    std::optional<std::string> sourceHandleId; ///< Choice / condition / event output.
    std::optional<Guard> condition;

    bool operator==(const Edge&) const = default;
};

/// Chapter-sized subgraph.
struct SegmentAsset {
    std::string id;
    std::string name;
    std::string rootNodeId;
    std::map<std::string, NarrativeNode, std::less<>> nodes; ///< Keyed by node id.
    std::vector<Edge> edges;

    bool operator==(const SegmentAsset&) const = default;
};

// -- RPG definitions ----------------------------------------------------------

enum class AttributeType : uint8_t { Number, Boolean, String };

struct AttributeDefinition {
    std::string id;
    std::string key;   ///< Script-facing name, e.g. "sanity".
    std::string name;  ///< Display name.
    AttributeType type = AttributeType::Number;
    Value defaultValue;
    std::optional<double> min;
    std::optional<double> max;
    std::string description;

    bool operator==(const AttributeDefinition&) const = default;
};

struct ItemIngredient {
    std::string itemId;
    int32_t count = 1;
    bool operator==(const ItemIngredient&) const = default;
};

struct Item {
    std::string id;
    std::string name;
    std::string description;
    bool stackable = false;
    std::vector<ItemIngredient> recipe; ///< Empty when not craftable.

    bool operator==(const Item&) const = default;
};

struct Clue {
    std::string id;
    std::string name;
    std::string description;
    bool revealed = false;
    std::vector<std::string> owners; ///< Character ids.

    bool operator==(const Clue&) const = default;
};

struct ShopItem {
    std::string itemId;
    double price = 0.0;
    std::string currencyAttributeId;
    std::optional<int32_t> stock; ///< Unlimited when absent.
    bool operator==(const ShopItem&) const = default;
};

struct Shop {
    std::string id;
    std::string name;
    std::string description;
    std::vector<ShopItem> inventory;
    bool operator==(const Shop&) const = default;
};

struct CharacterAsset {
    std::string id;
    std::string name;
    std::string avatarUrl;
    std::string description;
    bool operator==(const CharacterAsset&) const = default;
};

/// Root of the story document.
struct StoryAsset {
    std::string id;
    std::string title;
    std::string description;
    std::string activeSegmentId;
    std::vector<SegmentAsset> segments;
    std::vector<CharacterAsset> characters;
    std::vector<AttributeDefinition> attributes;
    std::vector<Item> items;
    std::vector<Clue> clues;
    std::vector<Shop> shops;

    bool operator==(const StoryAsset&) const = default;
};

// -- Lookup helpers -----------------------------------------------------------

[[nodiscard]] const SegmentAsset* findSegment(const StoryAsset& story, std::string_view id);
[[nodiscard]] SegmentAsset* findSegment(StoryAsset& story, std::string_view id);

[[nodiscard]] const NarrativeNode* findNode(const SegmentAsset& segment, std::string_view id);

/// Edges leaving @p nodeId, in document order.
[[nodiscard]] std::vector<const Edge*> outgoingEdges(const SegmentAsset& segment,
                                                     std::string_view nodeId);

/// Structural problems of a segment: map keys that disagree with node ids
/// and edges whose endpoints are missing. Empty when the segment is sound.
[[nodiscard]] std::vector<std::string> findSegmentProblems(const SegmentAsset& segment);

} // namespace nrt::story
