#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cachely::query {

// Fixed set of worker threads running background fetches.
// Queued jobs are still run when the pool is destroyed.
class FetchPool {
public:
    using Job = std::function<void()>;

    explicit FetchPool(size_t worker_count = 4);
    ~FetchPool();

    FetchPool(const FetchPool&) = delete;
    FetchPool& operator=(const FetchPool&) = delete;

    // False once the pool is shutting down
    bool submit(Job job);

    size_t pending() const;
    size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::deque<Job> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
};

} // namespace cachely::query
