#pragma once

/// @file logic_types.hpp
/// @brief Authored logic embedded in a story document: condition trees,
/// legacy guard expressions and action lists.

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nrt/story/value.hpp"

namespace nrt::story {

// -- Operands -----------------------------------------------------------------

/// Reads an attribute by id or key (authored as `var`, `attributeId` or
/// `attributeKey`).
struct AttributeRef {
    std::string ref;
    bool operator==(const AttributeRef&) const = default;
};

/// Reads the inventory count of an item.
struct ItemCountRef {
    std::string itemId;
    bool operator==(const ItemCountRef&) const = default;
};

/// Reads a flag attribute by key.
struct FlagRef {
    std::string key;
    bool operator==(const FlagRef&) const = default;
};

/// Comparison operand: a literal or a reference into runtime state.
using Operand = std::variant<Value, AttributeRef, ItemCountRef, FlagRef>;

// -- Condition trees ----------------------------------------------------------

/// Built-in condition type ids.
namespace condition_type {
inline constexpr const char* kLogicAnd = "LOGIC_AND";
inline constexpr const char* kLogicOr = "LOGIC_OR";
inline constexpr const char* kLogicNot = "LOGIC_NOT";
inline constexpr const char* kValueCompare = "VAL_COMPARE";
inline constexpr const char* kHasItem = "HAS_ITEM";
inline constexpr const char* kHasClue = "HAS_CLUE";
inline constexpr const char* kCheckFlag = "CHECK_FLAG";
} // namespace condition_type

/// A node of a structured condition tree.
///
/// `type` selects the handler in the ConditionRegistry. Scalar parameters
/// live in `params`; operands that may reference state (VAL_COMPARE's
/// `left` / `right`) live in `operands`. `negate` flips the final result
/// after the handler ran.
struct ConditionNode {
    std::string type;
    Params params;
    std::map<std::string, Operand, std::less<>> operands;
    std::vector<ConditionNode> children;
    bool negate = false;

    bool operator==(const ConditionNode&) const = default;
};

/// A guard written as `"identifier operator value"` text.
struct LegacyExpression {
    std::string text;
    bool operator==(const LegacyExpression&) const = default;
};

/// Edge or event guard: structured tree or legacy expression.
using Guard = std::variant<ConditionNode, LegacyExpression>;

// -- Actions ------------------------------------------------------------------

/// Built-in action type ids.
namespace action_type {
inline constexpr const char* kUpdateAttribute = "UPDATE_ATTRIBUTE";
inline constexpr const char* kAddItem = "ADD_ITEM";
inline constexpr const char* kRemoveItem = "REMOVE_ITEM";
inline constexpr const char* kAddClue = "ADD_CLUE";
inline constexpr const char* kRemoveClue = "REMOVE_CLUE";
inline constexpr const char* kShareClue = "SHARE_CLUE";
inline constexpr const char* kOpenShop = "OPEN_SHOP";
inline constexpr const char* kOpenCrafting = "OPEN_CRAFTING";
inline constexpr const char* kShowToast = "SHOW_TOAST";
inline constexpr const char* kPlaySound = "PLAY_SOUND";
inline constexpr const char* kScreenShake = "SCREEN_SHAKE";
inline constexpr const char* kWait = "WAIT";
inline constexpr const char* kJumpTo = "JUMP_TO";
inline constexpr const char* kAdvance = "ADVANCE";
} // namespace action_type

/// One authored action: handler type, parameters and scheduling flags.
struct ActionSpec {
    std::string id;
    std::string type;
    Params params;
    std::optional<std::chrono::milliseconds> delay; ///< Wait before running.
    bool async = false;        ///< Detach: do not wait for the handler.
    bool ignoreError = false;  ///< Log handler failures instead of failing the group.

    bool operator==(const ActionSpec&) const = default;
};

} // namespace nrt::story
