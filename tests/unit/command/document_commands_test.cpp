/// @file document_commands_test.cpp
/// @brief Unit tests for node and edge commands, including exact undo of
///        edge order.

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nrt/command/command_bus.hpp"
#include "nrt/command/document_commands.hpp"

using namespace nrt;
using namespace nrt::command;
using foundation::ErrorCode;

namespace {

story::NarrativeNode makeNode(const std::string& id) {
    story::NarrativeNode node;
    node.id = id;
    node.name = id;
    node.body = story::LocationBody{};
    return node;
}

story::Edge makeEdge(const std::string& id, const std::string& from, const std::string& to) {
    return story::Edge{.id = id, .sourceNodeId = from, .targetNodeId = to};
}

/// a -> b -> c, a -> c, c -> d
story::StoryAsset makeDoc() {
    story::StoryAsset doc;
    doc.id = "story_doc";
    story::SegmentAsset seg;
    seg.id = "seg";
    for (const char* id : {"a", "b", "c", "d"}) {
        seg.nodes.emplace(id, makeNode(id));
    }
    seg.edges = {makeEdge("e_ab", "a", "b"), makeEdge("e_bc", "b", "c"),
                 makeEdge("e_ac", "a", "c"), makeEdge("e_cd", "c", "d")};
    doc.segments.push_back(seg);
    return doc;
}

std::vector<std::string> edgeIds(const story::StoryAsset& doc) {
    std::vector<std::string> ids;
    for (const auto& e : doc.segments.front().edges) {
        ids.push_back(e.id);
    }
    return ids;
}

const story::SegmentAsset& seg(const story::StoryAsset& doc) { return doc.segments.front(); }

using Ids = std::vector<std::string>;

} // namespace

class DocumentCommandsTest : public ::testing::Test {
protected:
    story::StoryAsset doc_ = makeDoc();
    story::StoryAsset original_ = makeDoc();
    CommandBus history_;
};

// ============================================================================
// Nodes
// ============================================================================

TEST_F(DocumentCommandsTest, AddNodeToUnknownSegment) {
    AddNodeCommand command("seg_missing", makeNode("x"));
    auto result = command.apply(doc_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SegmentNotFound);
}

TEST_F(DocumentCommandsTest, AddNodeRoundTrip) {
    ASSERT_TRUE(history_.execute(std::make_unique<AddNodeCommand>("seg", makeNode("x")), doc_));
    EXPECT_TRUE(seg(doc_).nodes.contains("x"));

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, RemoveNodeDropsConnectedEdges) {
    auto command = RemoveNodeCommand::capture(doc_, "seg", "c");
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));

    EXPECT_FALSE(seg(doc_).nodes.contains("c"));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ab"}));
}

TEST_F(DocumentCommandsTest, RemoveNodeUndoRestoresEdgeOrder) {
    auto command = RemoveNodeCommand::capture(doc_, "seg", "c");
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ab", "e_bc", "e_ac", "e_cd"}));
    EXPECT_EQ(doc_, original_);

    ASSERT_TRUE(history_.redo(doc_));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ab"}));
}

TEST_F(DocumentCommandsTest, RemoveNodeCaptureErrors) {
    auto missingNode = RemoveNodeCommand::capture(doc_, "seg", "zz");
    ASSERT_TRUE(missingNode.hasError());
    EXPECT_EQ(missingNode.error().code(), ErrorCode::NodeNotFound);

    auto missingSegment = RemoveNodeCommand::capture(doc_, "nope", "a");
    ASSERT_TRUE(missingSegment.hasError());
    EXPECT_EQ(missingSegment.error().code(), ErrorCode::SegmentNotFound);
}

TEST_F(DocumentCommandsTest, UpdateNodePatchAndUndo) {
    auto command = UpdateNodeCommand::capture(doc_, "seg", "b", [](story::NarrativeNode& n) {
        n.name = "Library";
        n.position = story::Vector2{120.0, 40.0};
    });
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));

    const auto& updated = seg(doc_).nodes.at("b");
    EXPECT_EQ(updated.name, "Library");
    EXPECT_DOUBLE_EQ(updated.position.x, 120.0);

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, UpdateNodeRenamesId) {
    auto command = UpdateNodeCommand::capture(doc_, "seg", "d",
                                              [](story::NarrativeNode& n) { n.id = "d2"; });
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));
    EXPECT_FALSE(seg(doc_).nodes.contains("d"));
    EXPECT_TRUE(seg(doc_).nodes.contains("d2"));
    EXPECT_EQ(seg(doc_).edges.back().targetNodeId, "d2");
    EXPECT_TRUE(story::findSegmentProblems(seg(doc_)).empty());

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, UpdateNodeRenameFollowsRootAndChildren) {
    doc_.segments.front().rootNodeId = "a";
    doc_.segments.front().nodes.at("b").parentId = "a";
    original_ = doc_;

    auto command = UpdateNodeCommand::capture(doc_, "seg", "a",
                                              [](story::NarrativeNode& n) { n.id = "start"; });
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));

    EXPECT_EQ(seg(doc_).rootNodeId, "start");
    EXPECT_EQ(seg(doc_).nodes.at("b").parentId, std::optional<std::string>("start"));
    EXPECT_EQ(seg(doc_).edges[0].sourceNodeId, "start");
    EXPECT_EQ(seg(doc_).edges[2].sourceNodeId, "start");
    EXPECT_TRUE(story::findSegmentProblems(seg(doc_)).empty());

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, UpdateNodeRenameCollision) {
    auto command = UpdateNodeCommand::capture(doc_, "seg", "d",
                                              [](story::NarrativeNode& n) { n.id = "a"; });
    ASSERT_TRUE(command);
    auto result = history_.execute(std::move(command).value(), doc_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateNode);
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, BatchUpdateMovesSeveralNodes) {
    std::vector<NodeChange> changes;
    for (const char* id : {"a", "b"}) {
        NodeChange change{seg(doc_).nodes.at(id), seg(doc_).nodes.at(id)};
        change.after.position = story::Vector2{10.0, 20.0};
        changes.push_back(change);
    }
    ASSERT_TRUE(history_.execute(
        std::make_unique<BatchUpdateNodesCommand>("seg", std::move(changes)), doc_));
    EXPECT_EQ(history_.nextUndoName(), std::optional<std::string>("Batch Update Nodes"));
    EXPECT_DOUBLE_EQ(seg(doc_).nodes.at("a").position.y, 20.0);
    EXPECT_DOUBLE_EQ(seg(doc_).nodes.at("b").position.y, 20.0);

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

// ============================================================================
// Edges
// ============================================================================

TEST_F(DocumentCommandsTest, AddEdgeAndDuplicate) {
    ASSERT_TRUE(history_.execute(
        std::make_unique<AddEdgeCommand>("seg", makeEdge("e_bd", "b", "d")), doc_));
    EXPECT_EQ(edgeIds(doc_).back(), "e_bd");

    auto dup = history_.execute(
        std::make_unique<AddEdgeCommand>("seg", makeEdge("e_bd", "a", "d")), doc_);
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::AlreadyExists);

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, AddEdgeRejectsUnknownEndpoint) {
    auto toGhost = history_.execute(
        std::make_unique<AddEdgeCommand>("seg", makeEdge("e_ghost", "a", "ghost")), doc_);
    ASSERT_TRUE(toGhost.hasError());
    EXPECT_EQ(toGhost.error().code(), ErrorCode::NodeNotFound);

    auto fromGhost = history_.execute(
        std::make_unique<AddEdgeCommand>("seg", makeEdge("e_ghost", "ghost", "a")), doc_);
    ASSERT_TRUE(fromGhost.hasError());
    EXPECT_EQ(fromGhost.error().code(), ErrorCode::NodeNotFound);

    EXPECT_EQ(doc_, original_);
    EXPECT_FALSE(history_.canUndo());
}

TEST_F(DocumentCommandsTest, SegmentStaysConsistentAcrossCommands) {
    auto expectConsistent = [this] {
        EXPECT_TRUE(story::findSegmentProblems(seg(doc_)).empty());
    };

    ASSERT_TRUE(history_.execute(std::make_unique<AddNodeCommand>("seg", makeNode("x")), doc_));
    expectConsistent();
    ASSERT_TRUE(history_.execute(
        std::make_unique<AddEdgeCommand>("seg", makeEdge("e_dx", "d", "x")), doc_));
    expectConsistent();

    auto rename = UpdateNodeCommand::capture(doc_, "seg", "c",
                                             [](story::NarrativeNode& n) { n.id = "c2"; });
    ASSERT_TRUE(rename);
    ASSERT_TRUE(history_.execute(std::move(rename).value(), doc_));
    expectConsistent();

    auto removeEdge = RemoveEdgeCommand::capture(doc_, "seg", "e_ab");
    ASSERT_TRUE(removeEdge);
    ASSERT_TRUE(history_.execute(std::move(removeEdge).value(), doc_));
    expectConsistent();

    auto removeNode = RemoveNodeCommand::capture(doc_, "seg", "c2");
    ASSERT_TRUE(removeNode);
    ASSERT_TRUE(history_.execute(std::move(removeNode).value(), doc_));
    expectConsistent();

    auto batch = BatchDeleteCommand::capture(doc_, "seg", {"x"}, {});
    ASSERT_TRUE(batch);
    ASSERT_TRUE(history_.execute(std::move(batch).value(), doc_));
    expectConsistent();

    while (history_.canUndo()) {
        ASSERT_TRUE(history_.undo(doc_));
        expectConsistent();
    }
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, RemoveEdgeRestoresIndex) {
    auto command = RemoveEdgeCommand::capture(doc_, "seg", "e_bc");
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ab", "e_ac", "e_cd"}));

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ab", "e_bc", "e_ac", "e_cd"}));
}

TEST_F(DocumentCommandsTest, RemoveUnknownEdge) {
    auto command = RemoveEdgeCommand::capture(doc_, "seg", "e_zz");
    ASSERT_TRUE(command.hasError());
    EXPECT_EQ(command.error().code(), ErrorCode::EdgeNotFound);
}

// ============================================================================
// Batch delete and composites
// ============================================================================

TEST_F(DocumentCommandsTest, BatchDeleteNodesAndEdges) {
    auto command = BatchDeleteCommand::capture(doc_, "seg", {"b", "unknown"}, {"e_cd"});
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));

    EXPECT_FALSE(seg(doc_).nodes.contains("b"));
    EXPECT_EQ(seg(doc_).nodes.size(), 3u);
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ac"}));

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, BatchDeleteRestoresInterleavedEdges) {
    auto command = BatchDeleteCommand::capture(doc_, "seg", {"a", "d"}, {});
    ASSERT_TRUE(command);
    ASSERT_TRUE(history_.execute(std::move(command).value(), doc_));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_bc"}));

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(edgeIds(doc_), (Ids{"e_ab", "e_bc", "e_ac", "e_cd"}));
}

TEST_F(DocumentCommandsTest, CompositeAppliesInOrderAndRevertsInReverse) {
    std::vector<std::unique_ptr<Command>> steps;
    steps.push_back(std::make_unique<AddNodeCommand>("seg", makeNode("e")));
    steps.push_back(std::make_unique<AddEdgeCommand>("seg", makeEdge("e_de", "d", "e")));
    ASSERT_TRUE(history_.execute(
        std::make_unique<CompositeCommand>("Add Connected Node", std::move(steps)), doc_));

    EXPECT_TRUE(seg(doc_).nodes.contains("e"));
    EXPECT_EQ(edgeIds(doc_).back(), "e_de");
    EXPECT_EQ(history_.undoCount(), 1u);
    EXPECT_EQ(history_.nextUndoName(), std::optional<std::string>("Add Connected Node"));

    ASSERT_TRUE(history_.undo(doc_));
    EXPECT_EQ(doc_, original_);
}

TEST_F(DocumentCommandsTest, CompositeFailureIsAtomic) {
    std::vector<std::unique_ptr<Command>> steps;
    steps.push_back(std::make_unique<AddNodeCommand>("seg", makeNode("e")));
    steps.push_back(std::make_unique<AddNodeCommand>("seg", makeNode("a")));
    auto result = history_.execute(
        std::make_unique<CompositeCommand>("Broken", std::move(steps)), doc_);

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(doc_, original_);
    EXPECT_FALSE(history_.canUndo());
}
