#pragma once
#include "SessionEvent.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

// The single synchronisation point between the session loop and the
// threads feeding it (input, fetch workers, audio engine).
// Multi-producer, single-consumer; events come out in push order.
class EventQueue {
public:
    // Returns false once the queue is closed; the event is dropped
    bool push(SessionEvent ev) {
        {
            std::lock_guard lock(mtx_);
            if (closed_) return false;
            events_.push_back(std::move(ev));
        }
        cv_.notify_one();
        return true;
    }

    // Move up to maxEvents events into out, waiting at most waitMs for the
    // first one. Returns the number drained.
    size_t drain(std::vector<SessionEvent>& out, size_t maxEvents, int waitMs = 0) {
        std::unique_lock lock(mtx_);
        if (events_.empty() && !closed_ && waitMs > 0)
            cv_.wait_for(lock, std::chrono::milliseconds(waitMs),
                         [this] { return !events_.empty() || closed_; });

        size_t n = 0;
        while (!events_.empty() && n < maxEvents) {
            out.push_back(std::move(events_.front()));
            events_.pop_front();
            ++n;
        }
        return n;
    }

    // Refuse further pushes and discard anything still queued
    void close() {
        {
            std::lock_guard lock(mtx_);
            closed_ = true;
            events_.clear();
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mtx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mtx_);
        return events_.size();
    }

private:
    std::deque<SessionEvent> events_;
    bool closed_ = false;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};
