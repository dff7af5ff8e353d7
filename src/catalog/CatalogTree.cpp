#include "catalog/CatalogTree.hpp"
#include <spdlog/spdlog.h>

const NodeId CatalogTree::kRootId = "";

namespace {

// Kind of node a parent may hold. Artists sit directly under the root.
std::optional<NodeKind> expectedChildKind(NodeKind parent) {
    switch (parent) {
        case NodeKind::Artist: return NodeKind::Album;
        case NodeKind::Album:  return NodeKind::Track;
        case NodeKind::Track:  return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace

std::optional<FetchRequest> CatalogTree::beginRootLoad() {
    if (rootState_ == LoadState::Loading || rootState_ == LoadState::Loaded)
        return std::nullopt;
    rootState_ = LoadState::Loading;
    rootFailure_.clear();
    return FetchRequest{kRootId, FetchKind::Children};
}

// ── Expansion ────────────────────────────────────────────────────────────

std::optional<FetchRequest> CatalogTree::toggleExpand(const NodeId& id) {
    auto* node = findMutable(id);
    if (!node) {
        spdlog::debug("toggleExpand: unknown node '{}'", id);
        return std::nullopt;
    }

    switch (node->kind) {
        case NodeKind::Track:
            return std::nullopt;
        case NodeKind::Artist:
        case NodeKind::Album:
            if (node->expanded) {
                node->expanded = false;
                return std::nullopt;
            }
            return expand(id);
    }
    return std::nullopt;
}

std::optional<FetchRequest> CatalogTree::expand(const NodeId& id) {
    auto* node = findMutable(id);
    if (!node || !node->isContainer())
        return std::nullopt;

    node->expanded = true;

    switch (node->loadState) {
        case LoadState::NotLoaded:
        case LoadState::Failed:
            return startLoading(*node);
        case LoadState::Loading:
        case LoadState::Loaded:
            return std::nullopt;
    }
    return std::nullopt;
}

bool CatalogTree::collapse(const NodeId& id) {
    auto* node = findMutable(id);
    if (!node || !node->isContainer() || !node->expanded)
        return false;
    node->expanded = false;
    return true;
}

std::optional<FetchRequest> CatalogTree::startLoading(CatalogNode& node) {
    node.loadState = LoadState::Loading;
    node.failureReason.clear();
    return FetchRequest{node.id, FetchKind::Children};
}

// ── Fetch outcomes ───────────────────────────────────────────────────────

bool CatalogTree::applyChildrenLoaded(const NodeId& id,
                                      std::vector<CatalogNode> children) {
    if (id == kRootId) {
        if (rootState_ != LoadState::Loading) {
            spdlog::debug("Ignoring root listing: root is not loading");
            return false;
        }
        roots_ = insertChildren(kRootId, children);
        rootState_ = LoadState::Loaded;
        spdlog::info("Catalog root loaded: {} artists", roots_.size());
        return true;
    }

    auto* node = findMutable(id);
    if (!node || !node->isContainer()) {
        spdlog::warn("Children arrived for unknown or leaf node '{}'", id);
        return false;
    }
    if (node->loadState != LoadState::Loading) {
        spdlog::debug("Ignoring children for '{}': not loading", id);
        return false;
    }

    auto ids = insertChildren(id, children);
    node->children  = std::move(ids);
    node->loadState = LoadState::Loaded;
    spdlog::debug("Loaded {} children for {} '{}'", node->children->size(),
                  kindToString(node->kind), node->displayName);
    return true;
}

bool CatalogTree::applyChildrenFailed(const NodeId& id,
                                      const std::string& reason) {
    if (id == kRootId) {
        if (rootState_ != LoadState::Loading) return false;
        rootState_   = LoadState::Failed;
        rootFailure_ = reason;
        return true;
    }

    auto* node = findMutable(id);
    if (!node || node->loadState != LoadState::Loading)
        return false;

    // A failed branch collapses so it does not render as loading forever
    node->loadState     = LoadState::Failed;
    node->failureReason = reason;
    node->expanded      = false;
    return true;
}

std::vector<NodeId> CatalogTree::insertChildren(
    const NodeId& parentId, std::vector<CatalogNode>& children)
{
    std::optional<NodeKind> expected = NodeKind::Artist;
    if (parentId != kRootId)
        expected = expectedChildKind(nodes_.at(parentId).kind);

    std::vector<NodeId> ids;
    ids.reserve(children.size());

    for (auto& child : children) {
        if (!expected || child.kind != *expected) {
            spdlog::warn("Skipping {} '{}' under '{}': unexpected kind",
                         kindToString(child.kind), child.id, parentId);
            continue;
        }
        if (child.id.empty() || nodes_.count(child.id)) {
            spdlog::warn("Skipping empty or duplicate node id '{}'", child.id);
            continue;
        }

        child.parentId = parentId;
        child.children.reset();
        child.loadState = LoadState::NotLoaded;
        child.failureReason.clear();
        child.expanded = false;

        ids.push_back(child.id);
        nodes_.emplace(child.id, std::move(child));
    }
    return ids;
}

// ── Traversal ────────────────────────────────────────────────────────────

void CatalogTree::forEachVisibleRow(
    const std::function<bool(const VisibleRow&)>& visit) const {
    walk(roots_, 0, visit);
}

bool CatalogTree::walk(const std::vector<NodeId>& ids, int depth,
                       const std::function<bool(const VisibleRow&)>& visit) const {
    for (auto& id : ids) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) continue;

        if (!visit(VisibleRow{id, depth}))
            return false;

        auto& node = it->second;
        if (node.expanded && node.children) {
            if (!walk(*node.children, depth + 1, visit))
                return false;
        }
    }
    return true;
}

std::vector<VisibleRow> CatalogTree::visibleRows() const {
    std::vector<VisibleRow> rows;
    forEachVisibleRow([&](const VisibleRow& r) {
        rows.push_back(r);
        return true;
    });
    return rows;
}

// ── Lookup ───────────────────────────────────────────────────────────────

const CatalogNode* CatalogTree::find(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

CatalogNode* CatalogTree::findMutable(const NodeId& id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::optional<NodeId> CatalogTree::parentOf(const NodeId& id) const {
    auto* node = find(id);
    if (!node || node->parentId == kRootId)
        return std::nullopt;
    return node->parentId;
}

bool CatalogTree::isVisible(const NodeId& id) const {
    auto* node = find(id);
    if (!node) return false;

    while (node->parentId != kRootId) {
        node = find(node->parentId);
        if (!node || !node->expanded)
            return false;
    }
    return true;
}

std::optional<NodeId> CatalogTree::nearestVisible(const NodeId& id) const {
    std::optional<NodeId> current = id;
    while (current) {
        if (isVisible(*current))
            return current;
        current = parentOf(*current);
    }
    return std::nullopt;
}
