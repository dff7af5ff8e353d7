#include "session/SessionCoordinator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

SessionCoordinator::SessionCoordinator(ICatalogService& service,
                                       IAudioEngine& engine,
                                       std::shared_ptr<EventQueue> events,
                                       const AppConfig& config,
                                       JobDispatcher dispatchJob)
    : service_(service)
    , events_(std::move(events))
    , config_(config)
    , dispatchJob_(std::move(dispatchJob))
    , scheduler_(static_cast<size_t>(config.fetch.maxConcurrent))
    , playback_(engine, config.playback.volume)
{
    scheduler_.setDispatcher([this](const FetchRequest& r) { dispatch(r); });

    // Engine events arrive on the engine's thread; route them through the queue
    engine.setEventCallback([q = events_](const EngineEvent& ev) { q->push(ev); });
}

void SessionCoordinator::start() {
    spdlog::info("Session starting: backend={}, {} fetch slots",
                 service_.backendName(), scheduler_.maxConcurrent());
    playback_.setVolume(config_.playback.volume);
    submit(tree_.beginRootLoad());
    publish();
}

size_t SessionCoordinator::processBatch(int waitMs) {
    std::vector<SessionEvent> batch;
    size_t n = events_->drain(batch, static_cast<size_t>(config_.ui.maxEventsPerTick), waitMs);
    for (auto& ev : batch) {
        if (quit_) break;
        handle(ev);
    }
    if (n > 0) publish();
    return n;
}

void SessionCoordinator::run() {
    spdlog::debug("Session loop started");
    while (!quit_)
        processBatch(config_.ui.tickMs);
    spdlog::debug("Session loop stopped");
}

void SessionCoordinator::handle(const SessionEvent& ev) {
    if (auto* in = std::get_if<InputEvent>(&ev))
        onInput(in->intent);
    else if (auto* f = std::get_if<FetchFinished>(&ev))
        onFetchFinished(*f);
    else if (auto* e = std::get_if<EngineEvent>(&ev))
        onEngineEvent(*e);
}

// ── Input ────────────────────────────────────────────────────────────────

void SessionCoordinator::onInput(InputIntent intent) {
    spdlog::debug("Input: {}", intentToString(intent));
    notice_.clear();

    switch (intent) {
        case InputIntent::MoveUp:       moveSelection(-1); break;
        case InputIntent::MoveDown:     moveSelection(+1); break;
        case InputIntent::ToggleExpand: toggleSelected(); break;
        case InputIntent::Expand:       expandSelected(); break;
        case InputIntent::Collapse:     collapseSelected(); break;
        case InputIntent::Activate:     activateSelected(); break;
        case InputIntent::PlayPause:    playPause(); break;
        case InputIntent::SeekForward:
            playback_.seekBy(config_.playback.seekStepSeconds);
            break;
        case InputIntent::SeekBackward:
            playback_.seekBy(-config_.playback.seekStepSeconds);
            break;
        case InputIntent::VolumeUp:
            playback_.adjustVolume(config_.playback.volumeStep);
            break;
        case InputIntent::VolumeDown:
            playback_.adjustVolume(-config_.playback.volumeStep);
            break;
        case InputIntent::Retry:        retry(); break;
        case InputIntent::Quit:         quit(); break;
    }
}

void SessionCoordinator::moveSelection(int delta) {
    auto rows = tree_.visibleRows();
    if (rows.empty()) {
        selection_.reset();
        return;
    }

    size_t n = rows.size();
    size_t index = 0;
    auto it = selection_
        ? std::find_if(rows.begin(), rows.end(),
                       [&](const VisibleRow& r) { return r.id == *selection_; })
        : rows.end();

    if (it != rows.end()) {
        size_t current = static_cast<size_t>(it - rows.begin());
        index = delta > 0 ? (current + 1) % n : (current + n - 1) % n;
    }
    selection_ = rows[index].id;
}

void SessionCoordinator::toggleSelected() {
    if (!selection_) return;
    submit(tree_.toggleExpand(*selection_));
    revalidateSelection();
}

void SessionCoordinator::expandSelected() {
    auto* node = selectedNode();
    if (!node || !node->isContainer()) return;
    submit(tree_.expand(node->id));
    revalidateSelection();
}

// Collapse the selected container, or step out to the parent and
// collapse that
void SessionCoordinator::collapseSelected() {
    auto* node = selectedNode();
    if (!node) return;

    if (node->isContainer() && node->expanded) {
        tree_.collapse(node->id);
    } else if (auto parent = tree_.parentOf(node->id)) {
        tree_.collapse(*parent);
        selection_ = *parent;
    }
    revalidateSelection();
}

void SessionCoordinator::activateSelected() {
    auto* node = selectedNode();
    if (!node) return;

    switch (node->kind) {
        case NodeKind::Artist:
        case NodeKind::Album:
            toggleSelected();
            break;
        case NodeKind::Track:
            playTrack(*node);
            break;
    }
}

void SessionCoordinator::playPause() {
    if (playback_.togglePlayPause()) return;

    // Nothing to toggle: start the selected track from idle
    auto* node = selectedNode();
    if (std::holds_alternative<PlaybackIdle>(playback_.state()) &&
        node && node->kind == NodeKind::Track)
        playTrack(*node);
}

// Playback error first, then a failed library listing, then the
// selected failed branch
void SessionCoordinator::retry() {
    if (std::holds_alternative<PlaybackError>(playback_.state())) {
        playback_.retry();
        return;
    }
    if (tree_.rootState() == LoadState::Failed) {
        submit(tree_.beginRootLoad());
        return;
    }
    auto* node = selectedNode();
    if (node && node->loadState == LoadState::Failed) {
        submit(tree_.expand(node->id));
        revalidateSelection();
    }
}

void SessionCoordinator::quit() {
    spdlog::info("Quit requested");
    playback_.stop();
    scheduler_.abandon();
    events_->close();
    quit_ = true;
}

void SessionCoordinator::playTrack(const CatalogNode& track) {
    std::string url = service_.streamUrl(track.id);
    if (playback_.play(track.id, url, track.metadata.durationSec))
        spdlog::info("Playing '{}'", track.displayName);
    requestMedia(track);
}

void SessionCoordinator::requestMedia(const CatalogNode& track) {
    auto& m = media_[track.id];

    if (!track.metadata.coverArtId.empty() && !m.art && !m.artPending) {
        m.artPending = true;
        m.artFailed  = false;
        submit(FetchRequest{track.id, FetchKind::Art});
    }
    if (track.metadata.artist.empty() || track.displayName.empty()) {
        spdlog::debug("No artist or title for '{}', skipping lyrics lookup", track.id);
    } else if (!m.lyrics && !m.lyricsPending) {
        m.lyricsPending = true;
        m.lyricsFailed  = false;
        submit(FetchRequest{track.id, FetchKind::Lyrics});
    }
}

// ── Fetching ─────────────────────────────────────────────────────────────

void SessionCoordinator::submit(const std::optional<FetchRequest>& request) {
    if (!request) return;
    scheduler_.submit(*request);
}

// Called by the scheduler when a request gets a slot
void SessionCoordinator::dispatch(const FetchRequest& request) {
    FetchJob job{request, {}};
    if (auto* node = tree_.find(request.targetId))
        job.node = *node;
    if (dispatchJob_)
        dispatchJob_(std::move(job));
}

void SessionCoordinator::onFetchFinished(const FetchFinished& ev) {
    auto completion = scheduler_.complete(ev.request, ev.result);
    if (!completion) return;

    switch (completion->request.kind) {
        case FetchKind::Children: applyChildren(completion->request, completion->result); break;
        case FetchKind::Art:      applyArt(completion->request, completion->result); break;
        case FetchKind::Lyrics:   applyLyrics(completion->request, completion->result); break;
    }
}

void SessionCoordinator::applyChildren(const FetchRequest& req, const FetchResult& result) {
    if (auto* nodes = std::get_if<std::vector<CatalogNode>>(&result)) {
        tree_.applyChildrenLoaded(req.targetId, *nodes);
    } else {
        auto* f = std::get_if<FetchFailure>(&result);
        std::string reason = f ? f->reason : "unexpected response";
        if (tree_.applyChildrenFailed(req.targetId, reason))
            notice_ = "Could not load " + nameOf(req.targetId) + ": " + reason;
    }
    revalidateSelection();
}

void SessionCoordinator::applyArt(const FetchRequest& req, const FetchResult& result) {
    auto& m = media_[req.targetId];
    m.artPending = false;
    if (auto* art = std::get_if<ArtPayload>(&result)) {
        m.art = *art;
        return;
    }
    auto* f = std::get_if<FetchFailure>(&result);
    m.artFailed = true;
    notice_ = "Cover art unavailable: " + (f ? f->reason : std::string("unexpected response"));
}

void SessionCoordinator::applyLyrics(const FetchRequest& req, const FetchResult& result) {
    auto& m = media_[req.targetId];
    m.lyricsPending = false;
    if (auto* lyrics = std::get_if<LyricsPayload>(&result)) {
        m.lyrics = lyrics->text;
        return;
    }
    auto* f = std::get_if<FetchFailure>(&result);
    m.lyricsFailed = true;
    notice_ = "Lyrics unavailable: " + (f ? f->reason : std::string("unexpected response"));
}

// ── Engine ───────────────────────────────────────────────────────────────

void SessionCoordinator::onEngineEvent(const EngineEvent& ev) {
    if (!playback_.onEngineEvent(ev)) return;
    if (auto* e = std::get_if<PlaybackError>(&playback_.state()))
        spdlog::warn("Playback of {} failed: {}", e->track, e->reason);
}

// ── Selection ────────────────────────────────────────────────────────────

void SessionCoordinator::revalidateSelection() {
    if (selection_ && !tree_.isVisible(*selection_))
        selection_ = tree_.nearestVisible(*selection_);

    if (!selection_ && !tree_.roots().empty())
        selection_ = tree_.roots().front();
}

const CatalogNode* SessionCoordinator::selectedNode() const {
    return selection_ ? tree_.find(*selection_) : nullptr;
}

std::string SessionCoordinator::nameOf(const NodeId& id) const {
    if (id == CatalogTree::kRootId) return "library";
    auto* node = tree_.find(id);
    return node ? node->displayName : id;
}

const TrackMedia* SessionCoordinator::media(const NodeId& trackId) const {
    auto it = media_.find(trackId);
    return it == media_.end() ? nullptr : &it->second;
}

// ── Rendering ────────────────────────────────────────────────────────────

Frame SessionCoordinator::currentFrame() const {
    static const TrackMedia kNoMedia;

    RenderInput in;
    in.tree        = &tree_;
    in.selection   = selection_;
    in.playback    = playback_.state();
    in.duration    = playback_.duration();
    in.volume      = playback_.volume();
    in.notice      = notice_;
    in.lyricsLines = static_cast<size_t>(config_.ui.lyricsLines);

    // Panels follow the playing track, else the selected track
    std::optional<NodeId> panelTrack = playback_.currentTrack();
    if (!panelTrack) {
        auto* node = selectedNode();
        if (node && node->kind == NodeKind::Track)
            panelTrack = node->id;
    }
    if (panelTrack) {
        auto* m = media(*panelTrack);
        in.media = m ? m : &kNoMedia;
    }

    return RenderProjector::project(in);
}

void SessionCoordinator::publish() {
    if (onFrame_)
        onFrame_(currentFrame());
}
