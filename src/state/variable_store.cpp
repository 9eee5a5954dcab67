/// @file variable_store.cpp
/// @brief VariableStore implementation.

#include "nrt/state/variable_store.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>

#include "nrt/event/event_bus.hpp"
#include "nrt/event/story_events.hpp"
#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::state {

using foundation::LogCategory;
using story::Value;

namespace {

std::string_view trim(std::string_view text) {
    const auto* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

bool ownsClue(const ClueState& state, std::string_view characterId) {
    return std::find(state.owners.begin(), state.owners.end(), characterId) !=
           state.owners.end();
}

} // namespace

std::optional<ModifyOp> parseModifyOp(std::string_view name) {
    if (name == "add") { return ModifyOp::Add; }
    if (name == "sub") { return ModifyOp::Sub; }
    if (name == "set") { return ModifyOp::Set; }
    return std::nullopt;
}

template <typename P>
void VariableStore::publish(const char* topic, const P& payload) const {
    if (bus_ != nullptr) {
        bus_->Publish(topic, payload);
    }
}

void VariableStore::init(const story::StoryAsset& story) {
    reset();

    for (const auto& def : story.attributes) {
        attributeDefs_.insert_or_assign(def.id, def);
        auto initial = coerce(def, def.defaultValue);
        if (!initial) {
            NRT_LOG_WARN(LogCategory::State,
                         "Non-numeric default '" + story::toString(def.defaultValue) +
                             "' for attribute " + def.id + ", starting from 0");
            initial = coerce(def, Value{0.0});
        }
        attributes_[def.id] = *initial;
    }
    for (const auto& item : story.items) {
        itemDefs_.insert_or_assign(item.id, item);
    }
    for (const auto& clue : story.clues) {
        ClueState state;
        state.owners = clue.owners;
        state.revealed = clue.revealed || !clue.owners.empty();
        clues_[clue.id] = std::move(state);
    }

    NRT_LOG_DEBUG(LogCategory::State,
                  "Initialized " + std::to_string(attributes_.size()) + " attributes, " +
                      std::to_string(itemDefs_.size()) + " items, " +
                      std::to_string(clues_.size()) + " clues");
}

void VariableStore::reset() {
    attributeDefs_.clear();
    itemDefs_.clear();
    attributes_.clear();
    inventory_.clear();
    clues_.clear();
}

StoreSnapshot VariableStore::snapshot() const {
    return StoreSnapshot{attributes_, inventory_, clues_};
}

// -- Attributes ---------------------------------------------------------------

const story::AttributeDefinition*
VariableStore::findAttributeDefinition(std::string_view idOrKey) const {
    auto it = attributeDefs_.find(std::string(idOrKey));
    if (it != attributeDefs_.end()) {
        return &it->second;
    }
    for (const auto& [_, def] : attributeDefs_) {
        if (def.key == idOrKey) {
            return &def;
        }
    }
    return nullptr;
}

std::optional<Value> VariableStore::coerce(const story::AttributeDefinition& def,
                                           const Value& value) {
    switch (def.type) {
        case story::AttributeType::Number: {
            double n = story::toNumber(value);
            if (std::isnan(n)) {
                return std::nullopt;
            }
            if (def.min) {
                n = std::max(*def.min, n);
            }
            if (def.max) {
                n = std::min(*def.max, n);
            }
            return Value{n};
        }
        case story::AttributeType::Boolean:
            return Value{story::toString(value) == "true"};
        case story::AttributeType::String:
            break;
    }
    return value;
}

void VariableStore::setAttribute(std::string_view idOrKey, const Value& value) {
    const auto* def = findAttributeDefinition(idOrKey);
    std::string targetId = def != nullptr ? def->id : std::string(idOrKey);

    Value finalValue = value;
    if (def != nullptr) {
        auto coerced = coerce(*def, value);
        if (!coerced) {
            NRT_LOG_WARN(LogCategory::State,
                         "Ignoring non-numeric value '" + story::toString(value) +
                             "' for attribute " + targetId);
            return;
        }
        finalValue = std::move(*coerced);
    }

    Value oldValue;
    if (auto it = attributes_.find(targetId); it != attributes_.end()) {
        oldValue = it->second;
    }
    attributes_[targetId] = finalValue;

    if (oldValue != finalValue) {
        event::AttributeChanged payload;
        payload.id = targetId;
        payload.key = def != nullptr ? def->key : targetId;
        payload.value = finalValue;
        payload.oldValue = oldValue;
        publish(event::topics::kAttributeChanged, payload);
    }
}

Value VariableStore::getAttribute(std::string_view idOrKey) const {
    if (auto it = attributes_.find(std::string(idOrKey)); it != attributes_.end()) {
        return it->second;
    }
    for (const auto& [_, def] : attributeDefs_) {
        if (def.key == idOrKey) {
            auto it = attributes_.find(def.id);
            return it != attributes_.end() ? it->second : Value{};
        }
    }
    return Value{};
}

void VariableStore::modifyAttribute(std::string_view idOrKey, ModifyOp op, double value) {
    auto current = getAttribute(idOrKey);
    double n = story::toBool(current) ? story::toNumber(current) : 0.0;

    switch (op) {
        case ModifyOp::Add: n += value; break;
        case ModifyOp::Sub: n -= value; break;
        case ModifyOp::Set: n = value; break;
    }

    setAttribute(idOrKey, Value{n});
}

// -- Inventory ----------------------------------------------------------------

void VariableStore::addItem(std::string_view itemId, int32_t count) {
    if (count <= 0) {
        NRT_LOG_WARN(LogCategory::State,
                     "addItem ignored non-positive count for " + std::string(itemId));
        return;
    }

    std::string id(itemId);
    int32_t current = getItemCount(itemId);

    if (auto def = itemDefs_.find(id); def != itemDefs_.end()) {
        if (!def->second.stackable && current >= 1) {
            NRT_LOG_DEBUG(LogCategory::State,
                          "Item " + def->second.name + " is not stackable and already owned");
            return;
        }
    }

    auto total = static_cast<int32_t>(std::min<int64_t>(
        static_cast<int64_t>(current) + count, std::numeric_limits<int32_t>::max()));
    inventory_[id] = total;
    publish(event::topics::kInventoryAdded, event::InventoryChanged{id, count, total});
}

void VariableStore::removeItem(std::string_view itemId, int32_t count) {
    if (count <= 0) {
        NRT_LOG_WARN(LogCategory::State,
                     "removeItem ignored non-positive count for " + std::string(itemId));
        return;
    }

    std::string id(itemId);
    int32_t total = std::max(0, getItemCount(itemId) - count);

    if (total == 0) {
        inventory_.erase(id);
    } else {
        inventory_[id] = total;
    }
    publish(event::topics::kInventoryRemoved, event::InventoryChanged{id, count, total});
}

int32_t VariableStore::getItemCount(std::string_view itemId) const {
    auto it = inventory_.find(std::string(itemId));
    return it == inventory_.end() ? 0 : it->second;
}

bool VariableStore::hasItem(std::string_view itemId, int32_t count) const {
    return getItemCount(itemId) >= count;
}

// -- Clues --------------------------------------------------------------------

void VariableStore::addClue(std::string_view clueId, std::string_view characterId) {
    auto it = clues_.find(std::string(clueId));
    if (it == clues_.end()) {
        NRT_LOG_DEBUG(LogCategory::State, "addClue ignored unknown clue " + std::string(clueId));
        return;
    }
    auto& state = it->second;

    if (!state.revealed) {
        state.revealed = true;
        publish(event::topics::kClueRevealed, event::ClueRevealed{it->first});
    }

    if (!characterId.empty() && !ownsClue(state, characterId)) {
        state.owners.emplace_back(characterId);
        publish(event::topics::kClueObtained,
                event::ClueOwnership{it->first, std::string(characterId)});
    }
}

void VariableStore::removeClue(std::string_view clueId, std::string_view characterId) {
    auto it = clues_.find(std::string(clueId));
    if (it == clues_.end() || characterId.empty()) {
        return;
    }
    auto& owners = it->second.owners;
    auto removed = std::erase(owners, characterId);
    if (removed > 0) {
        publish(event::topics::kClueLost,
                event::ClueOwnership{it->first, std::string(characterId)});
    }
}

void VariableStore::shareClue(std::string_view clueId, std::string_view from,
                              std::string_view to) {
    auto it = clues_.find(std::string(clueId));
    if (it == clues_.end()) {
        return;
    }
    if (!ownsClue(it->second, from) || ownsClue(it->second, to)) {
        NRT_LOG_DEBUG(LogCategory::State,
                      "shareClue " + std::string(clueId) + " from " + std::string(from) +
                          " to " + std::string(to) + " skipped");
        return;
    }

    addClue(clueId, to);
    publish(event::topics::kClueShared,
            event::ClueShared{std::string(clueId), std::string(from), std::string(to)});
}

bool VariableStore::hasClue(std::string_view clueId, std::string_view characterId) const {
    auto it = clues_.find(std::string(clueId));
    if (it == clues_.end() || !it->second.revealed) {
        return false;
    }
    return characterId.empty() || ownsClue(it->second, characterId);
}

bool VariableStore::isClueRevealed(std::string_view clueId) const {
    auto it = clues_.find(std::string(clueId));
    return it != clues_.end() && it->second.revealed;
}

// -- Legacy guards ------------------------------------------------------------

bool VariableStore::evaluateCondition(std::string_view expression) const {
    auto text = trim(expression);
    if (text.empty()) {
        return true;
    }

    static const std::regex kPattern(R"(^(\w+)\s*([><=!]+|contains)\s*(.+)$)");
    std::string subject(text);
    std::smatch match;
    if (!std::regex_match(subject, match, kPattern)) {
        return story::toBool(getAttribute(text));
    }

    auto current = getAttribute(match[1].str());
    auto op = story::parseCompareOp(match[2].str());
    if (!op) {
        NRT_LOG_WARN(LogCategory::State, "Unknown operator " + match[2].str() +
                                             " in condition " + subject);
        return false;
    }
    return story::compareValues(current, story::parseLiteral(match[3].str()), *op);
}

} // namespace nrt::state
