#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "Logger.hpp"

// Fixed set of threads draining a FIFO of tasks. The destructor runs the
// tasks already queued, then joins.
class WorkerPool {
public:
    // Task failures are logged under `component`.
    WorkerPool(Logger& logger, std::string component, std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown has started.
    bool post(std::function<void()> task);
    void shutdown();

private:
    void run();

    Logger& logger_;
    std::string component_;
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};
