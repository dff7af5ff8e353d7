#include <gtest/gtest.h>
#include "render/RenderProjector.hpp"
#include "TestHelpers.hpp"

class RenderProjectorTest : public ::testing::Test {
protected:
    CatalogTree tree;

    void SetUp() override {
        tree.beginRootLoad();
        tree.applyChildrenLoaded(CatalogTree::kRootId, {makeArtist("A", "ABBA"), makeArtist("B", "Björk")});
        tree.toggleExpand("A");
        auto album = makeAlbum("al", "Arrival");
        album.metadata.year = 1976;
        tree.applyChildrenLoaded("A", {album});
        tree.toggleExpand("al");
        auto t = makeTrack("t1", "Dancing Queen", "al");
        t.metadata.trackNumber = 2;
        t.metadata.artist = "ABBA";
        tree.applyChildrenLoaded("al", {t});
    }

    RenderInput input() {
        RenderInput in;
        in.tree = &tree;
        in.volume = 80;
        return in;
    }
};

TEST_F(RenderProjectorTest, RowsFollowVisibleOrder) {
    auto f = RenderProjector::project(input());
    ASSERT_EQ(f.rows.size(), 4u);
    EXPECT_EQ(f.rows[0].label, "ABBA");
    EXPECT_EQ(f.rows[0].marker, RowMarker::Expanded);
    EXPECT_EQ(f.rows[1].label, "Arrival (1976)");
    EXPECT_EQ(f.rows[1].depth, 1);
    EXPECT_EQ(f.rows[2].label, "02. Dancing Queen  03:00");
    EXPECT_EQ(f.rows[2].marker, RowMarker::Leaf);
    EXPECT_EQ(f.rows[3].marker, RowMarker::Collapsed);
    EXPECT_TRUE(f.libraryMessage.empty());
}

TEST_F(RenderProjectorTest, SelectionAndNowPlaying) {
    auto in = input();
    in.selection = "al";
    in.playback  = PlaybackPlaying{"t1", 65.0};
    in.duration  = 180.0;

    auto f = RenderProjector::project(in);
    EXPECT_EQ(f.selected, std::optional<size_t>(1));
    EXPECT_TRUE(f.rows[2].nowPlaying);
    EXPECT_FALSE(f.rows[1].nowPlaying);
    EXPECT_EQ(f.nowPlaying, "Dancing Queen - ABBA");
    EXPECT_EQ(f.timeLabel, "01:05 / 03:00");
    EXPECT_NEAR(f.progress, 65.0 / 180.0, 1e-9);
    EXPECT_NE(f.status.find("Playing"), std::string::npos);
    EXPECT_NE(f.status.find("vol 80%"), std::string::npos);
}

TEST_F(RenderProjectorTest, LoadingAndFailedMarkers) {
    tree.toggleExpand("B");
    auto f = RenderProjector::project(input());
    EXPECT_EQ(f.rows.back().marker, RowMarker::Loading);

    tree.applyChildrenFailed("B", "timeout");
    f = RenderProjector::project(input());
    EXPECT_EQ(f.rows.back().marker, RowMarker::Failed);
    EXPECT_NE(f.rows.back().label.find("timeout"), std::string::npos);
}

TEST_F(RenderProjectorTest, ErrorStateShowsReason) {
    auto in = input();
    in.playback = PlaybackError{"t1", "unsupported format"};
    auto f = RenderProjector::project(in);
    EXPECT_NE(f.status.find("unsupported format"), std::string::npos);
    EXPECT_EQ(f.timeLabel, "00:00 / --:--");
    EXPECT_EQ(f.progress, 0.0);
}

TEST_F(RenderProjectorTest, ArtPlaceholderWhenMissingOrFailed) {
    auto in = input();
    in.playback = PlaybackPlaying{"t1", 1.0};

    TrackMedia failed;
    failed.artFailed = true;
    in.media = &failed;
    EXPECT_EQ(RenderProjector::project(in).artLines,
              (std::vector<std::string>{"[cover art unavailable]"}));

    TrackMedia none;
    in.media = &none;
    EXPECT_EQ(RenderProjector::project(in).artLines,
              (std::vector<std::string>{"[no cover art]"}));

    TrackMedia pending;
    pending.artPending = true;
    in.media = &pending;
    EXPECT_EQ(RenderProjector::project(in).artLines,
              (std::vector<std::string>{"[loading cover art…]"}));
}

TEST_F(RenderProjectorTest, ArtDescription) {
    // Signature and IHDR of a 44x16 image
    std::string png("\x89PNG\r\n\x1A\n\0\0\0\x0DIHDR\0\0\0\x2C\0\0\0\x10", 24);
    EXPECT_EQ(RenderProjector::describeImage({png, ""}), "PNG 44x16");

    std::string gif("GIF89a\x0A\0\x05\0", 10);
    EXPECT_EQ(RenderProjector::describeImage({gif, ""}), "GIF 10x5");

    // SOI, APP0 (length 4), SOF0 with height 300 and width 400
    std::string jpeg("\xFF\xD8"
                     "\xFF\xE0\x00\x04\x00\x00"
                     "\xFF\xC0\x00\x11\x08\x01\x2C\x01\x90\x03", 18);
    EXPECT_EQ(RenderProjector::describeImage({jpeg, ""}), "JPEG 400x300");

    EXPECT_EQ(RenderProjector::describeImage({"\xFF\xD8\xFF", ""}), "JPEG");
    EXPECT_EQ(RenderProjector::describeImage({"????", "image/bmp"}), "image/bmp");
    EXPECT_EQ(RenderProjector::describeImage({"????", ""}), "image");
}

TEST_F(RenderProjectorTest, LyricsAreTruncated) {
    auto in = input();
    in.playback = PlaybackPlaying{"t1", 1.0};
    in.lyricsLines = 2;

    TrackMedia m;
    m.lyrics = "one\r\ntwo\nthree";
    in.media = &m;
    EXPECT_EQ(RenderProjector::project(in).lyricsLines,
              (std::vector<std::string>{"one", "two"}));

    m.lyrics = "";
    EXPECT_EQ(RenderProjector::project(in).lyricsLines,
              (std::vector<std::string>{"No lyrics available"}));

    in.media = nullptr;
    EXPECT_EQ(RenderProjector::project(in).lyricsLines,
              (std::vector<std::string>{"No track selected"}));
}

TEST_F(RenderProjectorTest, LibraryMessages) {
    CatalogTree empty;
    RenderInput in;
    in.tree = &empty;
    EXPECT_EQ(RenderProjector::project(in).libraryMessage, "Loading library…");

    empty.beginRootLoad();
    empty.applyChildrenFailed(CatalogTree::kRootId, "refused");
    EXPECT_NE(RenderProjector::project(in).libraryMessage.find("refused"), std::string::npos);
}

TEST_F(RenderProjectorTest, ProjectionIsDeterministic) {
    auto in = input();
    in.selection = "t1";
    in.playback = PlaybackPaused{"t1", 42.0};
    in.duration = 180.0;
    in.notice = "Lyrics unavailable: not found";
    TrackMedia m;
    m.art = ArtPayload{"\xFF\xD8\xFF", "image/jpeg"};
    m.lyrics = "la la";
    in.media = &m;

    auto a = RenderProjector::project(in);
    auto b = RenderProjector::project(in);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.to_text(), b.to_text());
    EXPECT_NE(a.to_text().find("> "), std::string::npos);
}

TEST(RenderFormatTest, FormatTime) {
    EXPECT_EQ(RenderProjector::formatTime(0), "00:00");
    EXPECT_EQ(RenderProjector::formatTime(59.9), "00:59");
    EXPECT_EQ(RenderProjector::formatTime(3725), "62:05");
    EXPECT_EQ(RenderProjector::formatTime(-1), "--:--");
}
