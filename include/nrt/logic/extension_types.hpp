#pragma once

/// @file extension_types.hpp
/// @brief Editor-facing metadata that action and condition extensions
/// publish for catalog builders.

#include <cstdint>
#include <string>
#include <vector>

#include "nrt/story/value.hpp"

namespace nrt::logic {

enum class ParamType : uint8_t { String, Number, Boolean, Select, Entity };

struct ParamOption {
    std::string label;
    story::Value value;
};

/// One editable parameter of an extension.
struct ParamConfig {
    std::string name;
    std::string label;
    ParamType type = ParamType::String;
    std::string entityType; ///< character / item / clue / attribute / shop, for Entity
    std::vector<ParamOption> options;
    story::Value defaultValue;
    std::string placeholder;
};

struct ActionMetadata {
    std::string id;
    std::string label;
    std::string category;
    std::string description;
    std::vector<ParamConfig> params;
};

struct ConditionMetadata {
    std::string id;
    std::string label;
    std::string description;
    std::vector<ParamConfig> params;
};

} // namespace nrt::logic
