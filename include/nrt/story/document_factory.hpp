#pragma once

/// @file document_factory.hpp
/// @brief Builds default story, segment, node and edge values.

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>

#include "nrt/story/story_types.hpp"

namespace nrt::story {

/// Constructs documents with fresh ids of the form `<prefix>_<9 base-36
/// chars>`. Ids issued by one factory never repeat.
class DocumentFactory {
public:
    /// Seeded from std::random_device.
    DocumentFactory();

    /// Deterministic ids for tests and tools.
    explicit DocumentFactory(uint64_t seed);

    [[nodiscard]] std::string generateId(std::string_view prefix = "id");

    [[nodiscard]] StoryAsset createStory(std::string title = "New Story");

    [[nodiscard]] SegmentAsset createSegment(std::string name = "New Segment");

    /// Node with the default body for @p type, named "Dialogue" for
    /// dialogue nodes and "Node" otherwise, sized 300x200.
    [[nodiscard]] NarrativeNode createNode(NodeType type, Vector2 position = {});

    [[nodiscard]] Edge createEdge(std::string sourceId, std::string targetId,
                                  std::optional<std::string> sourceHandleId = std::nullopt);

private:
    std::mt19937_64 rng_;
    std::unordered_set<std::string> issued_;
};

} // namespace nrt::story
