#include "query/fetch_pool.hpp"
#include <exception>
#include <spdlog/spdlog.h>

namespace cachely::query {

FetchPool::FetchPool(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("FetchPool started with {} worker(s)", worker_count);
}

FetchPool::~FetchPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool FetchPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

size_t FetchPool::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void FetchPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Background fetch job failed: {}", e.what());
        } catch (...) {
            spdlog::error("Background fetch job failed with a non-standard exception");
        }
    }
}

} // namespace cachely::query
