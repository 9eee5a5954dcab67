#pragma once

/// @file command.hpp
/// @brief Undoable document mutation.

#include <string_view>

#include "nrt/foundation/story_result.hpp"
#include "nrt/story/story_types.hpp"

namespace nrt::command {

/// A reversible change to a StoryAsset.
///
/// Commands are pure: apply() and revert() map a document to a new
/// document and never touch storage themselves. Everything needed to
/// invert a command is captured when it is built, so no diffing happens
/// at undo time.
class Command {
public:
    virtual ~Command() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Forward transformation.
    [[nodiscard]] virtual foundation::StoryResult<story::StoryAsset>
    apply(const story::StoryAsset& doc) const = 0;

    /// Inverse of apply(); expects the document apply() produced.
    [[nodiscard]] virtual foundation::StoryResult<story::StoryAsset>
    revert(const story::StoryAsset& doc) const = 0;
};

} // namespace nrt::command
