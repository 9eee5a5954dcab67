#pragma once

/// @file variable_store.hpp
/// @brief Runtime RPG state: attribute values, inventory counts and clue
/// ownership, seeded from a story's definitions.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nrt/story/story_types.hpp"
#include "nrt/story/value.hpp"

namespace nrt::event {
class EventBus;
}

namespace nrt::state {

/// Arithmetic applied by modifyAttribute().
enum class ModifyOp : uint8_t { Add, Sub, Set };

/// Parse "add", "sub" or "set".
[[nodiscard]] std::optional<ModifyOp> parseModifyOp(std::string_view name);

/// Runtime state of one clue. Owning implies revealed.
struct ClueState {
    bool revealed = false;
    std::vector<std::string> owners;

    bool operator==(const ClueState&) const = default;
};

/// Copy of the three runtime namespaces.
struct StoreSnapshot {
    std::map<std::string, story::Value> attributes; ///< attribute id -> value
    std::map<std::string, int32_t> inventory;       ///< item id -> count (> 0)
    std::map<std::string, ClueState> clues;         ///< clue id -> state

    bool operator==(const StoreSnapshot&) const = default;
};

/// Single source of truth for RPG state during play.
///
/// Every mutation goes through these methods, which enforce the store's
/// invariants (numeric attributes within bounds, no zero inventory
/// entries, ownership implies revealed) and publish change events on the
/// attached EventBus. State is discarded and re-seeded by init().
///
/// Not thread-safe: each story instance owns its own store.
class VariableStore {
public:
    explicit VariableStore(event::EventBus* bus = nullptr) : bus_(bus) {}

    VariableStore(const VariableStore&) = delete;
    VariableStore& operator=(const VariableStore&) = delete;

    void setEventBus(event::EventBus* bus) noexcept { bus_ = bus; }

    /// Reset all namespaces from @p story's definitions.
    void init(const story::StoryAsset& story);

    /// Drop all definitions and runtime values.
    void reset();

    [[nodiscard]] StoreSnapshot snapshot() const;

    // -- Attributes -----------------------------------------------------------

    /// Store @p value for the attribute named by id or key.
    ///
    /// Numbers are clamped to the declared bounds and booleans are coerced
    /// from their text form. attribute:changed is published only when the
    /// stored value actually changes.
    void setAttribute(std::string_view idOrKey, const story::Value& value);

    /// Current value by id or key; absent when unknown.
    [[nodiscard]] story::Value getAttribute(std::string_view idOrKey) const;

    /// `current <op> value` with a missing current value counting as 0.
    void modifyAttribute(std::string_view idOrKey, ModifyOp op, double value);

    [[nodiscard]] const story::AttributeDefinition*
    findAttributeDefinition(std::string_view idOrKey) const;

    // -- Inventory ------------------------------------------------------------

    void addItem(std::string_view itemId, int32_t count = 1);

    /// Floors at zero; a zero count removes the entry.
    void removeItem(std::string_view itemId, int32_t count = 1);

    [[nodiscard]] int32_t getItemCount(std::string_view itemId) const;

    [[nodiscard]] bool hasItem(std::string_view itemId, int32_t count = 1) const;

    // -- Clues ----------------------------------------------------------------
    // An empty characterId means "no character".

    /// Reveal the clue and, when given, add @p characterId as an owner.
    void addClue(std::string_view clueId, std::string_view characterId = {});

    /// Remove ownership only; a clue is never un-revealed.
    void removeClue(std::string_view clueId, std::string_view characterId = {});

    /// Copy ownership from one character to another. No-op unless @p from
    /// owns the clue and @p to does not.
    void shareClue(std::string_view clueId, std::string_view from, std::string_view to);

    [[nodiscard]] bool hasClue(std::string_view clueId, std::string_view characterId = {}) const;

    [[nodiscard]] bool isClueRevealed(std::string_view clueId) const;

    // -- Legacy guards --------------------------------------------------------

    /// Evaluate `identifier operator value` against attribute values.
    ///
    /// Operators: ==, !=, >, >=, <, <=, contains. Empty text is true. Text
    /// that does not parse is read as a single boolean flag name.
    [[nodiscard]] bool evaluateCondition(std::string_view expression) const;

private:
    /// @p value converted to @p def's type and clamped to its bounds; empty
    /// when a Number attribute receives a non-numeric value.
    [[nodiscard]] static std::optional<story::Value>
    coerce(const story::AttributeDefinition& def, const story::Value& value);

    template <typename P>
    void publish(const char* topic, const P& payload) const;

    event::EventBus* bus_ = nullptr;

    std::unordered_map<std::string, story::AttributeDefinition> attributeDefs_;
    std::unordered_map<std::string, story::Item> itemDefs_;

    std::map<std::string, story::Value> attributes_;
    std::map<std::string, int32_t> inventory_;
    std::map<std::string, ClueState> clues_;
};

} // namespace nrt::state
