#include "nrt/story/story_types.hpp"

#include <algorithm>

namespace nrt::story {

std::string_view nodeTypeName(NodeType type) {
    switch (type) {
        case NodeType::Start:    return "START";
        case NodeType::Location: return "LOCATION";
        case NodeType::Dialogue: return "DIALOGUE";
        case NodeType::Branch:   return "BRANCH";
        case NodeType::Action:   return "ACTION";
        case NodeType::Jump:     return "JUMP";
        case NodeType::Vote:     return "VOTE";
    }
    return "UNKNOWN";
}

const SegmentAsset* findSegment(const StoryAsset& story, std::string_view id) {
    auto it = std::find_if(story.segments.begin(), story.segments.end(),
                           [id](const SegmentAsset& s) { return s.id == id; });
    return it == story.segments.end() ? nullptr : &(*it);
}

SegmentAsset* findSegment(StoryAsset& story, std::string_view id) {
    auto it = std::find_if(story.segments.begin(), story.segments.end(),
                           [id](const SegmentAsset& s) { return s.id == id; });
    return it == story.segments.end() ? nullptr : &(*it);
}

const NarrativeNode* findNode(const SegmentAsset& segment, std::string_view id) {
    auto it = segment.nodes.find(id);
    return it == segment.nodes.end() ? nullptr : &it->second;
}

std::vector<const Edge*> outgoingEdges(const SegmentAsset& segment, std::string_view nodeId) {
    std::vector<const Edge*> out;
    for (const auto& edge : segment.edges) {
        if (edge.sourceNodeId == nodeId) {
            out.push_back(&edge);
        }
    }
    return out;
}

std::vector<std::string> findSegmentProblems(const SegmentAsset& segment) {
    std::vector<std::string> problems;
    for (const auto& [key, node] : segment.nodes) {
        if (key != node.id) {
            problems.push_back("node key '" + key + "' holds node '" + node.id + "'");
        }
    }
    for (const auto& edge : segment.edges) {
        if (!segment.nodes.contains(edge.sourceNodeId)) {
            problems.push_back("edge '" + edge.id + "' has unknown source '" +
                               edge.sourceNodeId + "'");
        }
        if (!segment.nodes.contains(edge.targetNodeId)) {
            problems.push_back("edge '" + edge.id + "' has unknown target '" +
                               edge.targetNodeId + "'");
        }
    }
    return problems;
}

} // namespace nrt::story
