#pragma once
#include "FetchTypes.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>

// Owns the set of outstanding fetch requests. Duplicate (target, kind)
// pairs are refused, at most maxConcurrent requests are in flight and the
// rest wait in submission order.
//
// Not thread-safe: it lives on the session loop. Workers report back through
// the event queue, and the loop calls complete() when the result arrives.
class FetchScheduler {
public:
    enum class SubmitResult {
        Dispatched,     // handed to the dispatcher right away
        Queued,         // waiting for capacity
        AlreadyPending  // identical request outstanding, nothing done
    };

    using Dispatcher = std::function<void(const FetchRequest&)>;

    explicit FetchScheduler(size_t maxConcurrent = 4, Dispatcher dispatcher = {})
        : maxConcurrent_(std::max<size_t>(1, maxConcurrent))
        , dispatcher_(std::move(dispatcher)) {}

    void setDispatcher(Dispatcher d) { dispatcher_ = std::move(d); }

    SubmitResult submit(const FetchRequest& request) {
        if (isPending(request)) {
            spdlog::debug("Fetch {} already pending", request.describe());
            return SubmitResult::AlreadyPending;
        }

        if (inFlight_.size() < maxConcurrent_) {
            dispatch(request);
            return SubmitResult::Dispatched;
        }

        queued_.push_back(request);
        spdlog::debug("Fetch {} queued ({} waiting)", request.describe(),
                      queued_.size());
        return SubmitResult::Queued;
    }

    // Removes a finished request, frees its slot for the next queued one
    // and returns the completion to apply. Returns nullopt for requests
    // this scheduler no longer tracks (abandoned or unknown).
    std::optional<FetchCompletion> complete(const FetchRequest& request,
                                            FetchResult result) {
        if (inFlight_.erase(request) == 0) {
            spdlog::debug("Dropping completion for untracked fetch {}",
                          request.describe());
            return std::nullopt;
        }

        if (auto* f = std::get_if<FetchFailure>(&result))
            spdlog::warn("Fetch {} failed: {}", request.describe(), f->reason);

        while (!queued_.empty() && inFlight_.size() < maxConcurrent_) {
            auto next = queued_.front();
            queued_.pop_front();
            dispatch(next);
        }

        return FetchCompletion{request, std::move(result)};
    }

    // Forget everything. In-flight work is not interrupted; its results
    // are dropped by complete().
    void abandon() {
        if (!inFlight_.empty() || !queued_.empty())
            spdlog::info("Abandoning {} in-flight and {} queued fetches",
                         inFlight_.size(), queued_.size());
        inFlight_.clear();
        queued_.clear();
    }

    bool isPending(const FetchRequest& request) const {
        return inFlight_.count(request) > 0 ||
               std::find(queued_.begin(), queued_.end(), request) != queued_.end();
    }

    size_t outstandingCount() const { return inFlight_.size() + queued_.size(); }
    size_t inFlightCount() const    { return inFlight_.size(); }
    size_t queuedCount() const      { return queued_.size(); }
    size_t maxConcurrent() const    { return maxConcurrent_; }

private:
    void dispatch(const FetchRequest& request) {
        inFlight_.insert(request);
        spdlog::debug("Dispatching fetch {}", request.describe());
        if (dispatcher_)
            dispatcher_(request);
    }

    size_t maxConcurrent_;
    Dispatcher dispatcher_;
    std::set<FetchRequest>   inFlight_;
    std::deque<FetchRequest> queued_;
};
