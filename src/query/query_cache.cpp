#include "query/query_cache.hpp"
#include <spdlog/spdlog.h>

namespace cachely::query {

QueryCache::QueryCache(QueryConfig config, std::shared_ptr<storage::StorageBridge> storage, size_t fetch_workers)
    : pool_(std::make_shared<FetchPool>(fetch_workers))
    , eviction_policy_(std::make_unique<IdleEvictionPolicy>()) {
    auto ctx = std::make_shared<QueryContext>();
    ctx->config = config;
    ctx->storage = std::move(storage);
    ctx->pool = pool_;
    context_ = std::move(ctx);
}

QueryCache::~QueryCache() {
    stop_gc();
    // let queued background fetches finish while the registry is still alive
    pool_.reset();
}

QueryCache& QueryCache::instance() {
    static QueryCache cache;
    return cache;
}

void QueryCache::configure(QueryConfig config, std::shared_ptr<storage::StorageBridge> storage) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    auto ctx = std::make_shared<QueryContext>(*context_);
    ctx->config = config;
    ctx->storage = std::move(storage);
    context_ = std::move(ctx);
    spdlog::info("Query cache configured: {}", config_to_json(config).dump());
}

void QueryCache::set_clock(std::function<Clock::time_point()> clock) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    auto ctx = std::make_shared<QueryContext>(*context_);
    ctx->clock = std::move(clock);
    context_ = std::move(ctx);
}

QueryConfig QueryCache::config() const {
    return context()->config;
}

std::shared_ptr<storage::StorageBridge> QueryCache::storage() const {
    return context()->storage;
}

std::shared_ptr<const QueryContext> QueryCache::context() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return context_;
}

bool QueryCache::invalidate(const nlohmann::json& key) {
    auto query = registry_.get(encode_key(key));
    if (!query) {
        return false;
    }
    query->invalidate();
    return true;
}

size_t QueryCache::invalidate_where(const Predicate& predicate) {
    auto matches = registry_.where(predicate);
    for (const auto& query : matches) {
        query->invalidate();
    }
    return matches.size();
}

bool QueryCache::refetch(const nlohmann::json& key) {
    auto query = registry_.get(encode_key(key));
    if (!query) {
        return false;
    }
    query->refetch_in_background();
    return true;
}

size_t QueryCache::refetch_where(const Predicate& predicate) {
    auto matches = registry_.where(predicate);
    for (const auto& query : matches) {
        query->refetch_in_background();
    }
    return matches.size();
}

bool QueryCache::delete_cache(const nlohmann::json& key, bool delete_storage) {
    auto encoded = encode_key(key);
    bool removed = registry_.remove(encoded);

    if (delete_storage) {
        auto store = storage();
        if (store) {
            try {
                removed = store->erase(encoded) || removed;
            } catch (const std::exception& e) {
                spdlog::warn("Failed to delete stored query {}: {}", encoded, e.what());
            }
        }
    }
    return removed;
}

void QueryCache::delete_all(bool delete_storage) {
    registry_.clear();
    if (!delete_storage) {
        return;
    }

    auto store = storage();
    if (!store) {
        return;
    }
    try {
        store->clear();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to clear query storage: {}", e.what());
    }
}

std::vector<std::shared_ptr<QueryBase>> QueryCache::where(const Predicate& predicate) const {
    return registry_.where(predicate);
}

void QueryCache::reset() {
    registry_.clear();
    spdlog::debug("Query cache reset");
}

std::vector<std::string> QueryCache::sweep() {
    auto now = context()->now();
    std::lock_guard<std::mutex> lock(gc_mutex_);
    return registry_.sweep(*eviction_policy_, now);
}

void QueryCache::set_eviction_policy(std::unique_ptr<EvictionPolicy> policy) {
    if (!policy) {
        throw std::invalid_argument("eviction policy must not be null");
    }
    std::lock_guard<std::mutex> lock(gc_mutex_);
    eviction_policy_ = std::move(policy);
}

void QueryCache::start_gc(std::chrono::milliseconds interval) {
    if (interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("gc interval must be positive");
    }
    std::lock_guard<std::mutex> lock(gc_mutex_);
    if (gc_thread_.joinable()) {
        return;
    }
    gc_stopping_ = false;
    gc_thread_ = std::thread([this, interval]() { gc_loop(interval); });
    spdlog::debug("Query gc started (interval={}ms)", interval.count());
}

void QueryCache::stop_gc() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(gc_mutex_);
        if (!gc_thread_.joinable()) {
            return;
        }
        gc_stopping_ = true;
        worker = std::move(gc_thread_);
    }
    gc_cv_.notify_all();
    worker.join();
}

bool QueryCache::gc_running() const {
    std::lock_guard<std::mutex> lock(gc_mutex_);
    return gc_thread_.joinable();
}

void QueryCache::gc_loop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(gc_mutex_);
    while (!gc_cv_.wait_for(lock, interval, [this]() { return gc_stopping_; })) {
        auto now = context()->now();
        auto evicted = registry_.sweep(*eviction_policy_, now);
        if (!evicted.empty()) {
            spdlog::debug("Query gc evicted {} entr{}", evicted.size(), evicted.size() == 1 ? "y" : "ies");
        }
    }
}

} // namespace cachely::query
