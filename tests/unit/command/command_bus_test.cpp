/// @file command_bus_test.cpp
/// @brief Unit tests for CommandBus undo/redo history.

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "nrt/command/command_bus.hpp"
#include "nrt/command/document_commands.hpp"

using namespace nrt;
using namespace nrt::command;
using foundation::ErrorCode;

namespace {

story::StoryAsset makeDoc() {
    story::StoryAsset doc;
    doc.id = "story_doc";
    story::SegmentAsset seg;
    seg.id = "seg";
    doc.segments.push_back(seg);
    return doc;
}

story::NarrativeNode makeNode(const std::string& id) {
    story::NarrativeNode node;
    node.id = id;
    node.name = id;
    node.body = story::LocationBody{};
    return node;
}

std::unique_ptr<Command> addNode(const std::string& id) {
    return std::make_unique<AddNodeCommand>("seg", makeNode(id));
}

std::size_t nodeCount(const story::StoryAsset& doc) {
    return doc.segments.front().nodes.size();
}

} // namespace

class CommandBusTest : public ::testing::Test {
protected:
    story::StoryAsset doc_ = makeDoc();
    CommandBus bus_{3};
};

TEST_F(CommandBusTest, ExecuteAppliesAndRecords) {
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));

    EXPECT_EQ(nodeCount(doc_), 1u);
    EXPECT_TRUE(bus_.canUndo());
    EXPECT_FALSE(bus_.canRedo());
    EXPECT_EQ(bus_.nextUndoName(), std::optional<std::string>("Add Node"));
}

TEST_F(CommandBusTest, UndoRestoresExactDocument) {
    auto original = doc_;
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    ASSERT_TRUE(bus_.execute(addNode("n2"), doc_));

    ASSERT_TRUE(bus_.undo(doc_));
    ASSERT_TRUE(bus_.undo(doc_));

    EXPECT_EQ(doc_, original);
    EXPECT_EQ(bus_.redoCount(), 2u);
    EXPECT_EQ(bus_.nextRedoName(), std::optional<std::string>("Add Node"));
}

TEST_F(CommandBusTest, RedoReappliesInOrder) {
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    ASSERT_TRUE(bus_.execute(addNode("n2"), doc_));
    auto after = doc_;

    ASSERT_TRUE(bus_.undo(doc_));
    ASSERT_TRUE(bus_.undo(doc_));
    ASSERT_TRUE(bus_.redo(doc_));
    EXPECT_EQ(nodeCount(doc_), 1u);
    EXPECT_TRUE(doc_.segments.front().nodes.contains("n1"));

    ASSERT_TRUE(bus_.redo(doc_));
    EXPECT_EQ(doc_, after);
    EXPECT_FALSE(bus_.canRedo());
}

TEST_F(CommandBusTest, ExecuteClearsRedo) {
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    ASSERT_TRUE(bus_.undo(doc_));
    ASSERT_TRUE(bus_.canRedo());

    ASSERT_TRUE(bus_.execute(addNode("n2"), doc_));
    EXPECT_FALSE(bus_.canRedo());
    EXPECT_EQ(bus_.redoCount(), 0u);
}

TEST_F(CommandBusTest, CapacityDropsOldestEntry) {
    for (const char* id : {"n1", "n2", "n3", "n4"}) {
        ASSERT_TRUE(bus_.execute(addNode(id), doc_));
    }
    EXPECT_EQ(bus_.undoCount(), 3u);

    while (bus_.canUndo()) {
        ASSERT_TRUE(bus_.undo(doc_));
    }
    // n1 fell out of the history and stays.
    EXPECT_EQ(nodeCount(doc_), 1u);
    EXPECT_TRUE(doc_.segments.front().nodes.contains("n1"));
}

TEST_F(CommandBusTest, ZeroCapacityKeepsOneEntry) {
    CommandBus tiny(0);
    EXPECT_EQ(tiny.capacity(), 1u);
    ASSERT_TRUE(tiny.execute(addNode("n1"), doc_));
    ASSERT_TRUE(tiny.execute(addNode("n2"), doc_));
    EXPECT_EQ(tiny.undoCount(), 1u);
}

TEST_F(CommandBusTest, NullCommandRejected) {
    auto result = bus_.execute(nullptr, doc_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(CommandBusTest, EmptyStacks) {
    auto undo = bus_.undo(doc_);
    ASSERT_TRUE(undo.hasError());
    EXPECT_EQ(undo.error().code(), ErrorCode::NothingToUndo);

    auto redo = bus_.redo(doc_);
    ASSERT_TRUE(redo.hasError());
    EXPECT_EQ(redo.error().code(), ErrorCode::NothingToRedo);

    EXPECT_FALSE(bus_.nextUndoName().has_value());
    EXPECT_FALSE(bus_.nextRedoName().has_value());
}

TEST_F(CommandBusTest, RejectedApplyLeavesStateUntouched) {
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    ASSERT_TRUE(bus_.undo(doc_));
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    auto before = doc_;

    auto result = bus_.execute(addNode("n1"), doc_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateNode);
    EXPECT_EQ(doc_, before);
    EXPECT_EQ(bus_.undoCount(), 1u);
}

TEST_F(CommandBusTest, FailedUndoKeepsEntry) {
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    // The document changed behind the history's back.
    doc_.segments.front().nodes.clear();

    auto result = bus_.undo(doc_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NodeNotFound);
    EXPECT_EQ(bus_.undoCount(), 1u);
    EXPECT_EQ(bus_.redoCount(), 0u);
}

TEST_F(CommandBusTest, ClearDropsHistory) {
    ASSERT_TRUE(bus_.execute(addNode("n1"), doc_));
    ASSERT_TRUE(bus_.execute(addNode("n2"), doc_));
    ASSERT_TRUE(bus_.undo(doc_));

    bus_.clear();
    EXPECT_FALSE(bus_.canUndo());
    EXPECT_FALSE(bus_.canRedo());
    EXPECT_EQ(nodeCount(doc_), 1u);
}
