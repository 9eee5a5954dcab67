/// @file scene_graph.cpp
/// @brief SceneGraph implementation.

#include "nrt/scene/scene_graph.hpp"

#include <algorithm>

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::scene {

using foundation::LogCategory;

void SceneGraph::loadSegment(const story::SegmentAsset& segment) {
    clear();
    rootId_ = segment.rootNodeId;

    for (const auto& [id, node] : segment.nodes) {
        nodes_.insert_or_assign(node.id, node);
        insertionOrder_.push_back(node.id);
    }
    for (const auto& id : insertionOrder_) {
        const auto& node = nodes_.at(id);
        if (node.parentId && nodes_.contains(*node.parentId)) {
            children_[*node.parentId].push_back(id);
        }
    }

    NRT_LOG_DEBUG(LogCategory::Scene, "Segment " + segment.id + " loaded with " +
                                          std::to_string(nodes_.size()) + " nodes");
}

void SceneGraph::clear() {
    nodes_.clear();
    children_.clear();
    insertionOrder_.clear();
    selection_.clear();
    rootId_.clear();
}

void SceneGraph::addNode(story::NarrativeNode node) {
    std::string id = node.id;
    bool existed = nodes_.contains(id);
    if (existed) {
        detachFromParent(id);
    } else {
        insertionOrder_.push_back(id);
    }

    auto parent = node.parentId;
    nodes_.insert_or_assign(id, std::move(node));
    if (parent && nodes_.contains(*parent)) {
        children_[*parent].push_back(id);
    }

    // Nodes added earlier that already name this one as parent.
    if (!existed) {
        for (const auto& otherId : insertionOrder_) {
            const auto& other = nodes_.at(otherId);
            if (otherId != id && other.parentId == id) {
                children_[id].push_back(otherId);
            }
        }
    }
}

bool SceneGraph::removeNode(std::string_view id) {
    std::string key(id);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        return false;
    }

    detachFromParent(key);

    if (auto kids = children_.find(key); kids != children_.end()) {
        for (const auto& childId : kids->second) {
            if (auto child = nodes_.find(childId); child != nodes_.end()) {
                child->second.parentId.reset();
            }
        }
        children_.erase(kids);
    }

    nodes_.erase(it);
    std::erase(insertionOrder_, key);
    std::erase(selection_, key);
    return true;
}

const story::NarrativeNode* SceneGraph::getNode(std::string_view id) const {
    auto it = nodes_.find(std::string(id));
    return it == nodes_.end() ? nullptr : &it->second;
}

bool SceneGraph::setParent(std::string_view childId, std::optional<std::string> parentId) {
    std::string key(childId);
    auto it = nodes_.find(key);
    if (it == nodes_.end() || (parentId && !nodes_.contains(*parentId))) {
        return false;
    }

    detachFromParent(key);
    it->second.parentId = parentId;
    if (parentId) {
        children_[*parentId].push_back(key);
    }
    return true;
}

std::optional<std::string> SceneGraph::getParent(std::string_view id) const {
    const auto* node = getNode(id);
    if (node == nullptr) {
        return std::nullopt;
    }
    return node->parentId;
}

std::vector<std::string> SceneGraph::getChildren(std::string_view parentId) const {
    auto it = children_.find(std::string(parentId));
    return it == children_.end() ? std::vector<std::string>{} : it->second;
}

std::vector<std::string> SceneGraph::getRoots() const {
    std::vector<std::string> roots;
    for (const auto& id : insertionOrder_) {
        const auto& node = nodes_.at(id);
        if (!node.parentId || !nodes_.contains(*node.parentId)) {
            roots.push_back(id);
        }
    }
    return roots;
}

void SceneGraph::detachFromParent(const std::string& childId) {
    auto it = nodes_.find(childId);
    if (it == nodes_.end() || !it->second.parentId) {
        return;
    }
    auto kids = children_.find(*it->second.parentId);
    if (kids != children_.end()) {
        std::erase(kids->second, childId);
        if (kids->second.empty()) {
            children_.erase(kids);
        }
    }
}

// -- Selection ------------------------------------------------------------------

void SceneGraph::selectNode(std::string_view id, bool additive) {
    if (additive) {
        toggleSelection(id);
        return;
    }
    selection_.assign(1, std::string(id));
}

void SceneGraph::toggleSelection(std::string_view id) {
    if (isSelected(id)) {
        deselectNode(id);
    } else {
        selection_.emplace_back(id);
    }
}

void SceneGraph::deselectNode(std::string_view id) {
    std::erase(selection_, id);
}

bool SceneGraph::isSelected(std::string_view id) const {
    return std::find(selection_.begin(), selection_.end(), id) != selection_.end();
}

} // namespace nrt::scene
