/// @file document_factory.cpp
/// @brief DocumentFactory implementation.

#include "nrt/story/document_factory.hpp"

namespace nrt::story {

namespace {

constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t kSuffixLength = 9;

NodeBody defaultBody(NodeType type) {
    switch (type) {
        case NodeType::Start:    return StartBody{};
        case NodeType::Location: return LocationBody{};
        case NodeType::Dialogue: {
            DialogueBody body;
            body.text = "...";
            return body;
        }
        case NodeType::Branch:   return BranchBody{};
        case NodeType::Action:   return ActionBody{};
        case NodeType::Jump:     return JumpBody{};
        case NodeType::Vote:     return VoteBody{};
    }
    return StartBody{};
}

} // namespace

DocumentFactory::DocumentFactory() : rng_(std::random_device{}()) {}

DocumentFactory::DocumentFactory(uint64_t seed) : rng_(seed) {}

std::string DocumentFactory::generateId(std::string_view prefix) {
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
    while (true) {
        std::string id(prefix);
        id.push_back('_');
        for (std::size_t i = 0; i < kSuffixLength; ++i) {
            id.push_back(kAlphabet[pick(rng_)]);
        }
        if (issued_.insert(id).second) {
            return id;
        }
    }
}

StoryAsset DocumentFactory::createStory(std::string title) {
    StoryAsset story;
    story.id = generateId("story");
    story.title = std::move(title);
    return story;
}

SegmentAsset DocumentFactory::createSegment(std::string name) {
    SegmentAsset segment;
    segment.id = generateId("seg");
    segment.name = std::move(name);
    return segment;
}

NarrativeNode DocumentFactory::createNode(NodeType type, Vector2 position) {
    NarrativeNode node;
    node.id = generateId("node");
    node.name = type == NodeType::Dialogue ? "Dialogue" : "Node";
    node.position = position;
    node.body = defaultBody(type);
    return node;
}

Edge DocumentFactory::createEdge(std::string sourceId, std::string targetId,
                                 std::optional<std::string> sourceHandleId) {
    Edge edge;
    edge.id = generateId("edge");
    edge.sourceNodeId = std::move(sourceId);
    edge.targetNodeId = std::move(targetId);
    edge.sourceHandleId = std::move(sourceHandleId);
    return edge;
}

} // namespace nrt::story
