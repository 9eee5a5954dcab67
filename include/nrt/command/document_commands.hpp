#pragma once

/// @file document_commands.hpp
/// @brief Node and edge commands for the story document.

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nrt/command/command.hpp"

namespace nrt::command {

/// An edge together with its position in the segment's edge list, so a
/// removal can be reverted to the exact same order.
struct IndexedEdge {
    std::size_t index = 0;
    story::Edge edge;
};

/// Before/after pair of one node.
struct NodeChange {
    story::NarrativeNode before;
    story::NarrativeNode after;
};

class AddNodeCommand final : public Command {
public:
    AddNodeCommand(std::string segmentId, story::NarrativeNode node);

    std::string_view name() const override { return "Add Node"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    story::NarrativeNode node_;
};

/// Removes a node and every edge touching it.
class RemoveNodeCommand final : public Command {
public:
    RemoveNodeCommand(std::string segmentId, story::NarrativeNode node,
                      std::vector<IndexedEdge> edges);

    /// Capture the node and its connected edges from @p doc.
    static foundation::StoryResult<std::unique_ptr<RemoveNodeCommand>>
    capture(const story::StoryAsset& doc, std::string_view segmentId, std::string_view nodeId);

    std::string_view name() const override { return "Remove Node"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    story::NarrativeNode node_;
    std::vector<IndexedEdge> edges_;
};

class UpdateNodeCommand final : public Command {
public:
    UpdateNodeCommand(std::string segmentId, NodeChange change);

    /// Snapshot the node, run @p patch on a copy and keep both versions.
    static foundation::StoryResult<std::unique_ptr<UpdateNodeCommand>>
    capture(const story::StoryAsset& doc, std::string_view segmentId, std::string_view nodeId,
            const std::function<void(story::NarrativeNode&)>& patch);

    std::string_view name() const override { return "Update Node"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    NodeChange change_;
};

/// Several node updates as one history entry (multi-node drag).
class BatchUpdateNodesCommand final : public Command {
public:
    BatchUpdateNodesCommand(std::string segmentId, std::vector<NodeChange> changes);

    std::string_view name() const override { return "Batch Update Nodes"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    std::vector<NodeChange> changes_;
};

class AddEdgeCommand final : public Command {
public:
    AddEdgeCommand(std::string segmentId, story::Edge edge);

    std::string_view name() const override { return "Add Edge"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    story::Edge edge_;
};

class RemoveEdgeCommand final : public Command {
public:
    RemoveEdgeCommand(std::string segmentId, IndexedEdge edge);

    static foundation::StoryResult<std::unique_ptr<RemoveEdgeCommand>>
    capture(const story::StoryAsset& doc, std::string_view segmentId, std::string_view edgeId);

    std::string_view name() const override { return "Remove Edge"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    IndexedEdge edge_;
};

/// Deletes nodes, the listed edges and every edge touching a deleted node.
class BatchDeleteCommand final : public Command {
public:
    BatchDeleteCommand(std::string segmentId, std::vector<story::NarrativeNode> nodes,
                       std::vector<IndexedEdge> edges);

    /// Unknown node or edge ids are skipped.
    static foundation::StoryResult<std::unique_ptr<BatchDeleteCommand>>
    capture(const story::StoryAsset& doc, std::string_view segmentId,
            const std::vector<std::string>& nodeIds, const std::vector<std::string>& edgeIds);

    std::string_view name() const override { return "Batch Delete Entities"; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string segmentId_;
    std::vector<story::NarrativeNode> nodes_;
    std::vector<IndexedEdge> edges_; ///< Ascending index order.
};

/// Ordered group of commands; reverted in reverse order.
class CompositeCommand final : public Command {
public:
    CompositeCommand(std::string name, std::vector<std::unique_ptr<Command>> commands);

    std::string_view name() const override { return name_; }
    foundation::StoryResult<story::StoryAsset> apply(const story::StoryAsset& doc) const override;
    foundation::StoryResult<story::StoryAsset> revert(const story::StoryAsset& doc) const override;

private:
    std::string name_;
    std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace nrt::command
