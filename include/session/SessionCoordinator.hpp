#pragma once
#include "EventQueue.hpp"
#include "backend/ICatalogService.hpp"
#include "catalog/CatalogTree.hpp"
#include "config/AppConfig.hpp"
#include "fetch/FetchScheduler.hpp"
#include "fetch/FetchWorkerPool.hpp"
#include "playback/PlaybackController.hpp"
#include "render/RenderProjector.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

// Owns all mutable session state (tree, selection, playback, art/lyrics)
// and applies events from the queue one at a time on a single thread.
// After each drained batch one frame is projected and published.
//
// Nothing here blocks on I/O: backend calls go out as FetchJobs through
// the job dispatcher and come back as FetchFinished events; engine
// commands are fire-and-forget and report back as EngineEvents.
class SessionCoordinator {
public:
    using FrameCallback = std::function<void(const Frame&)>;
    using JobDispatcher = std::function<void(FetchJob)>;

    SessionCoordinator(ICatalogService& service,
                       IAudioEngine& engine,
                       std::shared_ptr<EventQueue> events,
                       const AppConfig& config,
                       JobDispatcher dispatchJob);

    void setFrameCallback(FrameCallback cb) { onFrame_ = std::move(cb); }

    // Request the root listing, apply the initial volume and publish the
    // first frame
    void start();

    // Apply one event
    void handle(const SessionEvent& ev);

    // Drain at most ui.max_events_per_tick events (waiting up to waitMs for
    // the first), apply them and publish a frame if any arrived.
    size_t processBatch(int waitMs);

    // Loop until Quit
    void run();

    bool quitRequested() const { return quit_; }

    Frame currentFrame() const;

    const CatalogTree&        tree() const { return tree_; }
    const PlaybackController& playback() const { return playback_; }
    const FetchScheduler&     scheduler() const { return scheduler_; }
    const std::optional<NodeId>& selection() const { return selection_; }
    const std::string&        notice() const { return notice_; }
    const TrackMedia*         media(const NodeId& trackId) const;

private:
    // ── Event handlers ──
    void onInput(InputIntent intent);
    void onFetchFinished(const FetchFinished& ev);
    void onEngineEvent(const EngineEvent& ev);

    // ── Intents ──
    void moveSelection(int delta);
    void toggleSelected();
    void expandSelected();
    void collapseSelected();
    void activateSelected();
    void playPause();
    void retry();
    void quit();

    void playTrack(const CatalogNode& track);
    void requestMedia(const CatalogNode& track);
    void submit(const std::optional<FetchRequest>& request);
    void dispatch(const FetchRequest& request);

    void applyChildren(const FetchRequest& req, const FetchResult& result);
    void applyArt(const FetchRequest& req, const FetchResult& result);
    void applyLyrics(const FetchRequest& req, const FetchResult& result);

    void revalidateSelection();
    const CatalogNode* selectedNode() const;
    std::string nameOf(const NodeId& id) const;
    void publish();

    ICatalogService&            service_;
    std::shared_ptr<EventQueue> events_;
    AppConfig                   config_;
    JobDispatcher               dispatchJob_;
    FrameCallback               onFrame_;

    CatalogTree        tree_;
    FetchScheduler     scheduler_;
    PlaybackController playback_;

    std::optional<NodeId>        selection_;
    std::map<NodeId, TrackMedia> media_;
    std::string                  notice_;
    bool                         quit_ = false;
};
