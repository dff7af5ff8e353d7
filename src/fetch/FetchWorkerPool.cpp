#include "fetch/FetchWorkerPool.hpp"
#include "catalog/CatalogTree.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

FetchWorkerPool::FetchWorkerPool(std::shared_ptr<ICatalogService> service,
                                 std::shared_ptr<EventQueue> events,
                                 size_t threadCount)
    : shared_(std::make_shared<Shared>())
    , threadCount_(std::max<size_t>(1, threadCount))
{
    shared_->service = std::move(service);
    shared_->events  = std::move(events);
}

FetchWorkerPool::~FetchWorkerPool() {
    shutdown(false);
}

void FetchWorkerPool::start() {
    if (!threads_.empty()) return;
    {
        std::lock_guard lock(shared_->mtx);
        shared_->busy.assign(threadCount_, false);
    }
    for (size_t i = 0; i < threadCount_; ++i)
        threads_.emplace_back(&FetchWorkerPool::workerLoop, shared_, i);
    spdlog::info("Fetch pool started: {} workers on {}", threadCount_,
                 shared_->service->backendName());
}

bool FetchWorkerPool::post(FetchJob job) {
    {
        std::lock_guard lock(shared_->mtx);
        if (shared_->stopping) return false;
        shared_->jobs.push_back(std::move(job));
    }
    shared_->cv.notify_one();
    return true;
}

size_t FetchWorkerPool::shutdown(bool abandon) {
    std::vector<bool> busy;
    {
        std::lock_guard lock(shared_->mtx);
        shared_->stopping = true;
        shared_->jobs.clear();
        busy = shared_->busy;
    }
    shared_->cv.notify_all();

    // A worker idle here cannot pick up another job: stopping is already set
    size_t detached = 0;
    for (size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (!t.joinable()) continue;
        if (abandon && i < busy.size() && busy[i]) {
            t.detach();
            detached++;
        } else {
            t.join();
        }
    }
    threads_.clear();

    if (detached > 0)
        spdlog::info("Fetch pool abandoned {} busy workers", detached);
    return detached;
}

// ── Worker ───────────────────────────────────────────────────────────────

void FetchWorkerPool::workerLoop(std::shared_ptr<Shared> shared, size_t index) {
    spdlog::debug("Fetch worker {} started", index);
    while (true) {
        FetchJob job;
        {
            std::unique_lock lock(shared->mtx);
            shared->cv.wait(lock, [&] { return shared->stopping || !shared->jobs.empty(); });
            if (shared->stopping) break;
            job = std::move(shared->jobs.front());
            shared->jobs.pop_front();
            shared->busy[index] = true;
        }

        auto result = execute(*shared->service, job);

        // A closed queue means the pool may have been abandoned and the
        // process may be exiting: touch nothing else, not even the logger
        if (!shared->events->push(FetchFinished{job.request, std::move(result)}))
            return;

        std::lock_guard lock(shared->mtx);
        shared->busy[index] = false;
    }
    spdlog::debug("Fetch worker {} stopped", index);
}

FetchResult FetchWorkerPool::execute(ICatalogService& service, const FetchJob& job) {
    const auto& req = job.request;
    try {
        switch (req.kind) {
            case FetchKind::Children:
                if (req.targetId == CatalogTree::kRootId)
                    return service.listArtists();
                return service.listChildren(job.node);
            case FetchKind::Art:
                return service.fetchArt(job.node);
            case FetchKind::Lyrics:
                return service.fetchLyrics(job.node);
        }
        return FetchFailure{"unsupported request"};
    } catch (const FetchError& e) {
        return FetchFailure{FetchError::kindToString(e.kind()) + ": " + e.what()};
    } catch (const std::exception& e) {
        spdlog::error("Fetch {} threw: {}", req.describe(), e.what());
        return FetchFailure{e.what()};
    }
}
