#pragma once
#include "FetchTypes.hpp"
#include "backend/ICatalogService.hpp"
#include "session/EventQueue.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// A request plus a snapshot of the node it targets, so workers never
// touch the catalog tree
struct FetchJob {
    FetchRequest request;
    CatalogNode  node;
};

// Fixed set of threads running blocking backend calls. Each result is
// pushed onto the event queue as a FetchFinished event.
//
// Workers share ownership of the service and the queue, so shutdown can
// leave them to finish a slow call on their own; the closed queue then
// drops whatever they produce and the worker exits without logging.
class FetchWorkerPool {
public:
    FetchWorkerPool(std::shared_ptr<ICatalogService> service,
                    std::shared_ptr<EventQueue> events,
                    size_t threadCount);
    ~FetchWorkerPool();

    void start();

    // Returns false after shutdown
    bool post(FetchJob job);

    // Stop accepting work and drop queued jobs. Idle workers are joined.
    // With abandon, workers still inside a backend call are detached
    // instead of joined. Returns the number of detached threads.
    size_t shutdown(bool abandon);

    size_t threadCount() const { return threadCount_; }

    // Runs one job against the service. Never throws: backend failures
    // become a FetchFailure result.
    static FetchResult execute(ICatalogService& service, const FetchJob& job);

private:
    struct Shared {
        std::shared_ptr<ICatalogService> service;
        std::shared_ptr<EventQueue>      events;
        std::mutex              mtx;
        std::condition_variable cv;
        std::deque<FetchJob>    jobs;
        std::vector<bool>       busy;      // per worker, set while a job runs
        bool                    stopping = false;
    };

    static void workerLoop(std::shared_ptr<Shared> shared, size_t index);

    std::shared_ptr<Shared>  shared_;
    std::vector<std::thread> threads_;
    size_t threadCount_;
};
