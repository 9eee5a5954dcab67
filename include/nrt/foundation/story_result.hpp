#pragma once

/// @file story_result.hpp
/// @brief StoryResult<T>: Result specialised with StoryError.

#include "nrt/core/result.hpp"
#include "nrt/foundation/story_error.hpp"

namespace nrt::foundation {

/// Result type used by every runtime operation that can fail.
///
/// Example:
/// @code
///   StoryResult<const SegmentAsset*> findSegment(const StoryAsset& story,
///                                                std::string_view id) {
///       for (const auto& seg : story.segments) {
///           if (seg.id == id) {
///               return StoryResult<const SegmentAsset*>::ok(&seg);
///           }
///       }
///       return StoryResult<const SegmentAsset*>::err(
///           StoryError(ErrorCode::SegmentNotFound, std::string(id)));
///   }
/// @endcode
template <typename T>
using StoryResult = nrt::Result<T, StoryError>;

}  // namespace nrt::foundation
