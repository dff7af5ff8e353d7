#include <gtest/gtest.h>
#include "catalog/CatalogTree.hpp"
#include "TestHelpers.hpp"

class CatalogTreeTest : public ::testing::Test {
protected:
    CatalogTree tree;

    void loadRoot(std::vector<CatalogNode> artists) {
        auto req = tree.beginRootLoad();
        ASSERT_TRUE(req.has_value());
        ASSERT_TRUE(tree.applyChildrenLoaded(CatalogTree::kRootId, std::move(artists)));
    }
};

TEST_F(CatalogTreeTest, RootLoadRequestsChildrenOfRoot) {
    auto req = tree.beginRootLoad();
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->targetId, CatalogTree::kRootId);
    EXPECT_EQ(req->kind, FetchKind::Children);
    EXPECT_EQ(tree.rootState(), LoadState::Loading);

    // Second call while loading does nothing
    EXPECT_FALSE(tree.beginRootLoad().has_value());
}

TEST_F(CatalogTreeTest, ExpandCollapseScenario) {
    loadRoot({makeArtist("A")});
    EXPECT_EQ(tree.visibleRows(), (std::vector<VisibleRow>{{"A", 0}}));

    auto req = tree.toggleExpand("A");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->targetId, "A");
    EXPECT_EQ(tree.find("A")->loadState, LoadState::Loading);

    ASSERT_TRUE(tree.applyChildrenLoaded("A", {makeAlbum("Album1")}));
    EXPECT_EQ(tree.visibleRows(),
              (std::vector<VisibleRow>{{"A", 0}, {"Album1", 1}}));

    // Collapse hides the album without a new request
    EXPECT_FALSE(tree.toggleExpand("A").has_value());
    EXPECT_EQ(tree.visibleRows(), (std::vector<VisibleRow>{{"A", 0}}));
}

TEST_F(CatalogTreeTest, LoadedChildrenAreNeverRequestedAgain) {
    loadRoot({makeArtist("A")});
    ASSERT_TRUE(tree.toggleExpand("A").has_value());
    ASSERT_TRUE(tree.applyChildrenLoaded("A", {makeAlbum("B1"), makeAlbum("B2")}));

    for (int i = 0; i < 10; i++)
        EXPECT_FALSE(tree.toggleExpand("A").has_value());

    EXPECT_FALSE(tree.expand("A").has_value());
    ASSERT_TRUE(tree.find("A")->children.has_value());
    EXPECT_EQ(tree.find("A")->children->size(), 2u);
}

TEST_F(CatalogTreeTest, ToggleWhileLoadingDoesNotRequestTwice) {
    loadRoot({makeArtist("A")});
    ASSERT_TRUE(tree.toggleExpand("A").has_value());
    EXPECT_FALSE(tree.toggleExpand("A").has_value());   // collapse
    EXPECT_FALSE(tree.toggleExpand("A").has_value());   // expand, still loading
    EXPECT_EQ(tree.find("A")->loadState, LoadState::Loading);
}

TEST_F(CatalogTreeTest, TrackToggleIsNoOp) {
    loadRoot({makeArtist("A")});
    tree.toggleExpand("A");
    tree.applyChildrenLoaded("A", {makeAlbum("B")});
    tree.toggleExpand("B");
    tree.applyChildrenLoaded("B", {makeTrack("T")});

    auto before = tree.visibleRows();
    EXPECT_FALSE(tree.toggleExpand("T").has_value());
    EXPECT_EQ(tree.visibleRows(), before);
    EXPECT_FALSE(tree.find("T")->expanded);
}

TEST_F(CatalogTreeTest, FailedLoadCollapsesAndRetriesOnExpand) {
    loadRoot({makeArtist("A")});
    ASSERT_TRUE(tree.toggleExpand("A").has_value());
    ASSERT_TRUE(tree.applyChildrenFailed("A", "timeout"));

    auto* a = tree.find("A");
    EXPECT_EQ(a->loadState, LoadState::Failed);
    EXPECT_EQ(a->failureReason, "timeout");
    EXPECT_FALSE(a->expanded);

    auto req = tree.toggleExpand("A");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(tree.find("A")->loadState, LoadState::Loading);
    EXPECT_TRUE(tree.find("A")->failureReason.empty());
}

TEST_F(CatalogTreeTest, CollapsedAncestorHidesDescendants) {
    loadRoot({makeArtist("A"), makeArtist("Z")});
    tree.toggleExpand("A");
    tree.applyChildrenLoaded("A", {makeAlbum("B")});
    tree.toggleExpand("B");
    tree.applyChildrenLoaded("B", {makeTrack("T1"), makeTrack("T2")});

    EXPECT_EQ(tree.visibleRows(),
              (std::vector<VisibleRow>{{"A", 0}, {"B", 1}, {"T1", 2}, {"T2", 2}, {"Z", 0}}));

    tree.collapse("A");
    EXPECT_EQ(tree.visibleRows(), (std::vector<VisibleRow>{{"A", 0}, {"Z", 0}}));
    EXPECT_FALSE(tree.isVisible("T1"));
    EXPECT_FALSE(tree.isVisible("B"));

    // B is still expanded; re-expanding A brings the whole branch back
    tree.expand("A");
    EXPECT_TRUE(tree.isVisible("T2"));
}

TEST_F(CatalogTreeTest, NoVisibleRowHasCollapsedAncestor) {
    loadRoot({makeArtist("A"), makeArtist("C")});
    tree.toggleExpand("A");
    tree.applyChildrenLoaded("A", {makeAlbum("A1"), makeAlbum("A2")});
    tree.toggleExpand("A1");
    tree.applyChildrenLoaded("A1", {makeTrack("t1")});
    tree.toggleExpand("C");
    tree.applyChildrenLoaded("C", {makeAlbum("C1")});

    const std::vector<NodeId> toggles = {"A", "A1", "C", "A", "C1", "A1", "A", "C"};
    for (auto& id : toggles) {
        tree.toggleExpand(id);
        for (auto& row : tree.visibleRows()) {
            auto parent = tree.parentOf(row.id);
            while (parent) {
                EXPECT_TRUE(tree.find(*parent)->expanded)
                    << row.id << " visible under collapsed " << *parent;
                parent = tree.parentOf(*parent);
            }
        }
    }
}

TEST_F(CatalogTreeTest, StaleChildrenAreIgnored) {
    loadRoot({makeArtist("A")});
    // Not loading: result is dropped
    EXPECT_FALSE(tree.applyChildrenLoaded("A", {makeAlbum("B")}));
    EXPECT_FALSE(tree.contains("B"));

    EXPECT_FALSE(tree.applyChildrenLoaded("missing", {}));
    EXPECT_FALSE(tree.applyChildrenFailed("A", "late failure"));
}

TEST_F(CatalogTreeTest, WrongKindAndDuplicateChildrenAreSkipped) {
    loadRoot({makeArtist("A"), makeArtist("A"), makeAlbum("X")});
    EXPECT_EQ(tree.roots(), (std::vector<NodeId>{"A"}));

    tree.toggleExpand("A");
    tree.applyChildrenLoaded("A", {makeAlbum("B"), makeTrack("T"), makeAlbum("")});
    ASSERT_TRUE(tree.find("A")->children.has_value());
    EXPECT_EQ(*tree.find("A")->children, (std::vector<NodeId>{"B"}));
    EXPECT_EQ(tree.find("B")->parentId, "A");
}

TEST_F(CatalogTreeTest, NearestVisibleWalksUpToExpandedAncestor) {
    loadRoot({makeArtist("A")});
    tree.toggleExpand("A");
    tree.applyChildrenLoaded("A", {makeAlbum("B")});
    tree.toggleExpand("B");
    tree.applyChildrenLoaded("B", {makeTrack("T")});

    tree.collapse("B");
    EXPECT_EQ(tree.nearestVisible("T"), std::optional<NodeId>("B"));
    tree.collapse("A");
    EXPECT_EQ(tree.nearestVisible("T"), std::optional<NodeId>("A"));
    EXPECT_FALSE(tree.nearestVisible("unknown").has_value());
}

TEST_F(CatalogTreeTest, RootFailureCanBeRetried) {
    ASSERT_TRUE(tree.beginRootLoad().has_value());
    ASSERT_TRUE(tree.applyChildrenFailed(CatalogTree::kRootId, "refused"));
    EXPECT_EQ(tree.rootState(), LoadState::Failed);
    EXPECT_EQ(tree.rootFailure(), "refused");

    EXPECT_TRUE(tree.beginRootLoad().has_value());
    EXPECT_TRUE(tree.rootFailure().empty());
}
