/// @file document_commands.cpp
/// @brief Node and edge command implementations.

#include "nrt/command/document_commands.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace nrt::command {

using foundation::ErrorCode;
using foundation::StoryError;
using foundation::StoryResult;
using story::Edge;
using story::NarrativeNode;
using story::SegmentAsset;
using story::StoryAsset;

namespace {

using DocResult = StoryResult<StoryAsset>;

DocResult fail(ErrorCode code, std::string message, const std::string& id) {
    return DocResult::err(StoryError(code, std::move(message), id));
}

DocResult missingSegment(const std::string& segmentId) {
    return fail(ErrorCode::SegmentNotFound, "segment not found: " + segmentId, segmentId);
}

std::vector<Edge>::iterator findEdge(SegmentAsset& segment, std::string_view edgeId) {
    return std::find_if(segment.edges.begin(), segment.edges.end(),
                        [edgeId](const Edge& e) { return e.id == edgeId; });
}

void restoreEdges(SegmentAsset& segment, const std::vector<IndexedEdge>& edges) {
    // Ascending indices replay the original layout.
    for (const auto& entry : edges) {
        auto pos = std::min(entry.index, segment.edges.size());
        segment.edges.insert(segment.edges.begin() + static_cast<std::ptrdiff_t>(pos),
                             entry.edge);
    }
}

void dropEdges(SegmentAsset& segment, const std::vector<IndexedEdge>& edges) {
    std::set<std::string, std::less<>> ids;
    for (const auto& entry : edges) {
        ids.insert(entry.edge.id);
    }
    std::erase_if(segment.edges, [&ids](const Edge& e) { return ids.contains(e.id); });
}

std::vector<IndexedEdge> edgesTouching(const SegmentAsset& segment,
                                       const std::set<std::string, std::less<>>& nodeIds,
                                       const std::set<std::string, std::less<>>& edgeIds) {
    std::vector<IndexedEdge> out;
    for (std::size_t i = 0; i < segment.edges.size(); ++i) {
        const auto& e = segment.edges[i];
        if (edgeIds.contains(e.id) || nodeIds.contains(e.sourceNodeId) ||
            nodeIds.contains(e.targetNodeId)) {
            out.push_back(IndexedEdge{i, e});
        }
    }
    return out;
}

/// Points every reference to node @p from at @p to.
void renameReferences(SegmentAsset& segment, const std::string& from, const std::string& to) {
    for (auto& edge : segment.edges) {
        if (edge.sourceNodeId == from) {
            edge.sourceNodeId = to;
        }
        if (edge.targetNodeId == from) {
            edge.targetNodeId = to;
        }
    }
    for (auto& [_, node] : segment.nodes) {
        if (node.parentId == from) {
            node.parentId = to;
        }
    }
    if (segment.rootNodeId == from) {
        segment.rootNodeId = to;
    }
}

DocResult replaceNode(const StoryAsset& doc, const std::string& segmentId,
                      const NarrativeNode& from, const NarrativeNode& to) {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId);
    if (!segment) {
        return missingSegment(segmentId);
    }
    auto it = segment->nodes.find(from.id);
    if (it == segment->nodes.end()) {
        return fail(ErrorCode::NodeNotFound, "node not found: " + from.id, from.id);
    }
    if (from.id == to.id) {
        it->second = to;
    } else {
        if (segment->nodes.contains(to.id)) {
            return fail(ErrorCode::DuplicateNode, "node already exists: " + to.id, to.id);
        }
        segment->nodes.erase(it);
        segment->nodes.emplace(to.id, to);
        renameReferences(*segment, from.id, to.id);
    }
    return DocResult::ok(std::move(next));
}

DocResult applyChanges(const StoryAsset& doc, const std::string& segmentId,
                       const std::vector<NodeChange>& changes, bool forward) {
    StoryAsset current = doc;
    for (const auto& change : changes) {
        const auto& from = forward ? change.before : change.after;
        const auto& to = forward ? change.after : change.before;
        auto next = replaceNode(current, segmentId, from, to);
        if (next.hasError()) {
            return next;
        }
        current = std::move(next).value();
    }
    return DocResult::ok(std::move(current));
}

} // namespace

// AddNodeCommand

AddNodeCommand::AddNodeCommand(std::string segmentId, NarrativeNode node)
    : segmentId_(std::move(segmentId)), node_(std::move(node)) {}

DocResult AddNodeCommand::apply(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    if (!segment->nodes.emplace(node_.id, node_).second) {
        return fail(ErrorCode::DuplicateNode, "node already exists: " + node_.id, node_.id);
    }
    return DocResult::ok(std::move(next));
}

DocResult AddNodeCommand::revert(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    if (segment->nodes.erase(node_.id) == 0) {
        return fail(ErrorCode::NodeNotFound, "node not found: " + node_.id, node_.id);
    }
    return DocResult::ok(std::move(next));
}

// RemoveNodeCommand

RemoveNodeCommand::RemoveNodeCommand(std::string segmentId, NarrativeNode node,
                                     std::vector<IndexedEdge> edges)
    : segmentId_(std::move(segmentId)), node_(std::move(node)), edges_(std::move(edges)) {}

StoryResult<std::unique_ptr<RemoveNodeCommand>>
RemoveNodeCommand::capture(const StoryAsset& doc, std::string_view segmentId,
                           std::string_view nodeId) {
    using R = StoryResult<std::unique_ptr<RemoveNodeCommand>>;
    const auto* segment = story::findSegment(doc, segmentId);
    if (!segment) {
        return R::err(StoryError(ErrorCode::SegmentNotFound,
                                 "segment not found: " + std::string(segmentId),
                                 std::string(segmentId)));
    }
    const auto* node = story::findNode(*segment, nodeId);
    if (!node) {
        return R::err(StoryError(ErrorCode::NodeNotFound,
                                 "node not found: " + std::string(nodeId), std::string(nodeId)));
    }
    auto edges = edgesTouching(*segment, {std::string(nodeId)}, {});
    return R::ok(std::make_unique<RemoveNodeCommand>(std::string(segmentId), *node,
                                                     std::move(edges)));
}

DocResult RemoveNodeCommand::apply(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    if (segment->nodes.erase(node_.id) == 0) {
        return fail(ErrorCode::NodeNotFound, "node not found: " + node_.id, node_.id);
    }
    dropEdges(*segment, edges_);
    return DocResult::ok(std::move(next));
}

DocResult RemoveNodeCommand::revert(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    if (!segment->nodes.emplace(node_.id, node_).second) {
        return fail(ErrorCode::DuplicateNode, "node already exists: " + node_.id, node_.id);
    }
    restoreEdges(*segment, edges_);
    return DocResult::ok(std::move(next));
}

// UpdateNodeCommand

UpdateNodeCommand::UpdateNodeCommand(std::string segmentId, NodeChange change)
    : segmentId_(std::move(segmentId)), change_(std::move(change)) {}

StoryResult<std::unique_ptr<UpdateNodeCommand>>
UpdateNodeCommand::capture(const StoryAsset& doc, std::string_view segmentId,
                           std::string_view nodeId,
                           const std::function<void(NarrativeNode&)>& patch) {
    using R = StoryResult<std::unique_ptr<UpdateNodeCommand>>;
    const auto* segment = story::findSegment(doc, segmentId);
    if (!segment) {
        return R::err(StoryError(ErrorCode::SegmentNotFound,
                                 "segment not found: " + std::string(segmentId),
                                 std::string(segmentId)));
    }
    const auto* node = story::findNode(*segment, nodeId);
    if (!node) {
        return R::err(StoryError(ErrorCode::NodeNotFound,
                                 "node not found: " + std::string(nodeId), std::string(nodeId)));
    }
    NodeChange change{*node, *node};
    if (patch) {
        patch(change.after);
    }
    return R::ok(std::make_unique<UpdateNodeCommand>(std::string(segmentId), std::move(change)));
}

DocResult UpdateNodeCommand::apply(const StoryAsset& doc) const {
    return replaceNode(doc, segmentId_, change_.before, change_.after);
}

DocResult UpdateNodeCommand::revert(const StoryAsset& doc) const {
    return replaceNode(doc, segmentId_, change_.after, change_.before);
}

// BatchUpdateNodesCommand

BatchUpdateNodesCommand::BatchUpdateNodesCommand(std::string segmentId,
                                                 std::vector<NodeChange> changes)
    : segmentId_(std::move(segmentId)), changes_(std::move(changes)) {}

DocResult BatchUpdateNodesCommand::apply(const StoryAsset& doc) const {
    return applyChanges(doc, segmentId_, changes_, true);
}

DocResult BatchUpdateNodesCommand::revert(const StoryAsset& doc) const {
    return applyChanges(doc, segmentId_, changes_, false);
}

// AddEdgeCommand

AddEdgeCommand::AddEdgeCommand(std::string segmentId, Edge edge)
    : segmentId_(std::move(segmentId)), edge_(std::move(edge)) {}

DocResult AddEdgeCommand::apply(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    if (findEdge(*segment, edge_.id) != segment->edges.end()) {
        return fail(ErrorCode::AlreadyExists, "edge already exists: " + edge_.id, edge_.id);
    }
    for (const auto& endpoint : {edge_.sourceNodeId, edge_.targetNodeId}) {
        if (!segment->nodes.contains(endpoint)) {
            return fail(ErrorCode::NodeNotFound,
                        "edge " + edge_.id + " references unknown node " + endpoint, endpoint);
        }
    }
    segment->edges.push_back(edge_);
    return DocResult::ok(std::move(next));
}

DocResult AddEdgeCommand::revert(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    auto it = findEdge(*segment, edge_.id);
    if (it == segment->edges.end()) {
        return fail(ErrorCode::EdgeNotFound, "edge not found: " + edge_.id, edge_.id);
    }
    segment->edges.erase(it);
    return DocResult::ok(std::move(next));
}

// RemoveEdgeCommand

RemoveEdgeCommand::RemoveEdgeCommand(std::string segmentId, IndexedEdge edge)
    : segmentId_(std::move(segmentId)), edge_(std::move(edge)) {}

StoryResult<std::unique_ptr<RemoveEdgeCommand>>
RemoveEdgeCommand::capture(const StoryAsset& doc, std::string_view segmentId,
                           std::string_view edgeId) {
    using R = StoryResult<std::unique_ptr<RemoveEdgeCommand>>;
    const auto* segment = story::findSegment(doc, segmentId);
    if (!segment) {
        return R::err(StoryError(ErrorCode::SegmentNotFound,
                                 "segment not found: " + std::string(segmentId),
                                 std::string(segmentId)));
    }
    for (std::size_t i = 0; i < segment->edges.size(); ++i) {
        if (segment->edges[i].id == edgeId) {
            return R::ok(std::make_unique<RemoveEdgeCommand>(
                std::string(segmentId), IndexedEdge{i, segment->edges[i]}));
        }
    }
    return R::err(StoryError(ErrorCode::EdgeNotFound, "edge not found: " + std::string(edgeId),
                             std::string(edgeId)));
}

DocResult RemoveEdgeCommand::apply(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    auto it = findEdge(*segment, edge_.edge.id);
    if (it == segment->edges.end()) {
        return fail(ErrorCode::EdgeNotFound, "edge not found: " + edge_.edge.id, edge_.edge.id);
    }
    segment->edges.erase(it);
    return DocResult::ok(std::move(next));
}

DocResult RemoveEdgeCommand::revert(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    if (findEdge(*segment, edge_.edge.id) != segment->edges.end()) {
        return fail(ErrorCode::AlreadyExists, "edge already exists: " + edge_.edge.id,
                    edge_.edge.id);
    }
    restoreEdges(*segment, {edge_});
    return DocResult::ok(std::move(next));
}

// BatchDeleteCommand

BatchDeleteCommand::BatchDeleteCommand(std::string segmentId, std::vector<NarrativeNode> nodes,
                                       std::vector<IndexedEdge> edges)
    : segmentId_(std::move(segmentId)), nodes_(std::move(nodes)), edges_(std::move(edges)) {}

StoryResult<std::unique_ptr<BatchDeleteCommand>>
BatchDeleteCommand::capture(const StoryAsset& doc, std::string_view segmentId,
                            const std::vector<std::string>& nodeIds,
                            const std::vector<std::string>& edgeIds) {
    using R = StoryResult<std::unique_ptr<BatchDeleteCommand>>;
    const auto* segment = story::findSegment(doc, segmentId);
    if (!segment) {
        return R::err(StoryError(ErrorCode::SegmentNotFound,
                                 "segment not found: " + std::string(segmentId),
                                 std::string(segmentId)));
    }

    std::vector<NarrativeNode> nodes;
    std::set<std::string, std::less<>> deletedNodes;
    for (const auto& id : nodeIds) {
        const auto* node = story::findNode(*segment, id);
        if (node && deletedNodes.insert(id).second) {
            nodes.push_back(*node);
        }
    }
    std::set<std::string, std::less<>> explicitEdges(edgeIds.begin(), edgeIds.end());
    auto edges = edgesTouching(*segment, deletedNodes, explicitEdges);

    return R::ok(std::make_unique<BatchDeleteCommand>(std::string(segmentId), std::move(nodes),
                                                      std::move(edges)));
}

DocResult BatchDeleteCommand::apply(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    for (const auto& node : nodes_) {
        if (segment->nodes.erase(node.id) == 0) {
            return fail(ErrorCode::NodeNotFound, "node not found: " + node.id, node.id);
        }
    }
    dropEdges(*segment, edges_);
    return DocResult::ok(std::move(next));
}

DocResult BatchDeleteCommand::revert(const StoryAsset& doc) const {
    StoryAsset next = doc;
    auto* segment = story::findSegment(next, segmentId_);
    if (!segment) {
        return missingSegment(segmentId_);
    }
    for (const auto& node : nodes_) {
        if (!segment->nodes.emplace(node.id, node).second) {
            return fail(ErrorCode::DuplicateNode, "node already exists: " + node.id, node.id);
        }
    }
    restoreEdges(*segment, edges_);
    return DocResult::ok(std::move(next));
}

// CompositeCommand

CompositeCommand::CompositeCommand(std::string name, std::vector<std::unique_ptr<Command>> commands)
    : name_(std::move(name)), commands_(std::move(commands)) {}

DocResult CompositeCommand::apply(const StoryAsset& doc) const {
    StoryAsset current = doc;
    for (const auto& command : commands_) {
        auto next = command->apply(current);
        if (next.hasError()) {
            return next;
        }
        current = std::move(next).value();
    }
    return DocResult::ok(std::move(current));
}

DocResult CompositeCommand::revert(const StoryAsset& doc) const {
    StoryAsset current = doc;
    for (auto it = commands_.rbegin(); it != commands_.rend(); ++it) {
        auto previous = (*it)->revert(current);
        if (previous.hasError()) {
            return previous;
        }
        current = std::move(previous).value();
    }
    return DocResult::ok(std::move(current));
}

} // namespace nrt::command
