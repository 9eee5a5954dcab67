#pragma once

/// @file scene_graph.hpp
/// @brief Node hierarchy and selection bookkeeping for the active segment.

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nrt/story/story_types.hpp"

namespace nrt::scene {

/// Parent/child index over the nodes of one segment, plus a selection
/// set.
///
/// Hierarchy comes from each node's `parentId`. Removing a node detaches
/// its children (they become roots) instead of deleting them. No cycle
/// detection is performed.
class SceneGraph {
public:
    SceneGraph() = default;

    /// Replace all nodes with the segment's and rebuild the child index.
    /// Clears the selection.
    void loadSegment(const story::SegmentAsset& segment);

    void clear();

    // -- Nodes ------------------------------------------------------------------

    /// Insert or replace a node; a new node is appended to its parent's
    /// children.
    void addNode(story::NarrativeNode node);

    /// @return false when the node is unknown.
    bool removeNode(std::string_view id);

    [[nodiscard]] const story::NarrativeNode* getNode(std::string_view id) const;

    [[nodiscard]] bool hasNode(std::string_view id) const { return getNode(id) != nullptr; }

    [[nodiscard]] std::size_t nodeCount() const noexcept { return nodes_.size(); }

    [[nodiscard]] const std::string& rootId() const noexcept { return rootId_; }

    // -- Hierarchy --------------------------------------------------------------

    /// Move @p childId under @p parentId, or to the top level when nullopt.
    /// @return false when either node is unknown.
    bool setParent(std::string_view childId, std::optional<std::string> parentId);

    [[nodiscard]] std::optional<std::string> getParent(std::string_view id) const;

    /// Children in insertion order.
    [[nodiscard]] std::vector<std::string> getChildren(std::string_view parentId) const;

    /// Nodes without a (known) parent.
    [[nodiscard]] std::vector<std::string> getRoots() const;

    // -- Selection --------------------------------------------------------------

    /// Exclusive selection replaces the set; additive selection toggles
    /// @p id in it.
    void selectNode(std::string_view id, bool additive = false);

    void toggleSelection(std::string_view id);

    void deselectNode(std::string_view id);

    void clearSelection() { selection_.clear(); }

    [[nodiscard]] bool isSelected(std::string_view id) const;

    /// Selected ids in selection order.
    [[nodiscard]] const std::vector<std::string>& getSelectedNodes() const noexcept {
        return selection_;
    }

private:
    void detachFromParent(const std::string& childId);

    std::unordered_map<std::string, story::NarrativeNode> nodes_;
    std::unordered_map<std::string, std::vector<std::string>> children_;
    std::vector<std::string> insertionOrder_;
    std::vector<std::string> selection_;
    std::string rootId_;
};

} // namespace nrt::scene
