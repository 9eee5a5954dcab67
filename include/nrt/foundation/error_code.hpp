#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the narrative runtime.

#include <cstdint>
#include <string_view>

namespace nrt::foundation {

/// Error codes grouped by subsystem in 256-value ranges, so the source
/// subsystem can be recovered from the numeric value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Story document (0x0100 - 0x01FF)
    StoryNotLoaded = 0x0100,
    SegmentNotFound = 0x0101,
    NodeNotFound = 0x0102,
    EdgeNotFound = 0x0103,
    DuplicateNode = 0x0104,

    // Action pipeline (0x0200 - 0x02FF)
    ActionFailed = 0x0200,
    UnknownAction = 0x0201,
    ActionValidationFailed = 0x0202,
    ActionCancelled = 0x0203,

    // Condition pipeline (0x0300 - 0x03FF)
    UnknownCondition = 0x0300,
    ConditionValidationFailed = 0x0301,

    // Navigation (0x0400 - 0x04FF)
    NavigationCycle = 0x0400,
    DeadEnd = 0x0401,
    ChoiceRequired = 0x0402,

    // Command bus (0x0500 - 0x05FF)
    NothingToUndo = 0x0500,
    NothingToRedo = 0x0501,
    CommandFailed = 0x0502,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0700 - 0x07FF)
    LoggerError = 0x0700,
    LoggerFlushFailed = 0x0701,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Story";
        case 0x0200: return "Action";
        case 0x0300: return "Condition";
        case 0x0400: return "Navigation";
        case 0x0500: return "Command";
        case 0x0600: return "Config";
        case 0x0700: return "Logger";
        default: return "Unknown";
    }
}

} // namespace nrt::foundation
