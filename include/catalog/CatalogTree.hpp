#pragma once
#include "CatalogNode.hpp"
#include "fetch/FetchTypes.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct VisibleRow {
    NodeId id;
    int    depth = 0;

    bool operator==(const VisibleRow& o) const {
        return id == o.id && depth == o.depth;
    }
};

// In-memory browse hierarchy: root -> artists -> albums -> tracks.
// Nodes are created when their parent's children arrive and never removed.
// The tree performs no I/O; operations that need data return a
// FetchRequest for the caller to submit.
class CatalogTree {
public:
    // Reserved id of the invisible root whose children are the artists
    static const NodeId kRootId;

    CatalogTree() = default;

    // Root listing
    std::optional<FetchRequest> beginRootLoad();
    LoadState rootState() const { return rootState_; }
    const std::string& rootFailure() const { return rootFailure_; }
    const std::vector<NodeId>& roots() const { return roots_; }

    // Expansion. toggleExpand flips Artist/Album nodes and returns a
    // Children request when the node has to be (re)loaded.
    std::optional<FetchRequest> toggleExpand(const NodeId& id);
    std::optional<FetchRequest> expand(const NodeId& id);
    bool collapse(const NodeId& id);

    // Fetch outcomes for a Children request
    bool applyChildrenLoaded(const NodeId& id, std::vector<CatalogNode> children);
    bool applyChildrenFailed(const NodeId& id, const std::string& reason);

    // Pre-order walk over rows whose ancestors are all expanded.
    // The visitor returns false to stop early. Recomputed on every call.
    void forEachVisibleRow(const std::function<bool(const VisibleRow&)>& visit) const;
    std::vector<VisibleRow> visibleRows() const;

    // Lookup helpers
    const CatalogNode* find(const NodeId& id) const;
    bool contains(const NodeId& id) const { return nodes_.count(id) > 0; }
    std::optional<NodeId> parentOf(const NodeId& id) const;
    bool isVisible(const NodeId& id) const;

    // Closest visible node on the path from id up to the root
    std::optional<NodeId> nearestVisible(const NodeId& id) const;

    size_t size() const { return nodes_.size(); }

private:
    CatalogNode* findMutable(const NodeId& id);
    std::optional<FetchRequest> startLoading(CatalogNode& node);
    std::vector<NodeId> insertChildren(const NodeId& parentId,
                                       std::vector<CatalogNode>& children);
    bool walk(const std::vector<NodeId>& ids, int depth,
              const std::function<bool(const VisibleRow&)>& visit) const;

    std::unordered_map<NodeId, CatalogNode> nodes_;
    std::vector<NodeId> roots_;
    LoadState   rootState_ = LoadState::NotLoaded;
    std::string rootFailure_;
};
