/**
 * Query cache
 *
 * Entry point of the library. Owns the registry, the resolved configuration,
 * the optional StorageBridge and the fetch pool, and hands out typed queries
 * by key. One process-wide instance is available through instance(); tests
 * and embedders can also create their own.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "query/config.hpp"
#include "query/context.hpp"
#include "query/eviction.hpp"
#include "query/fetch_pool.hpp"
#include "query/key.hpp"
#include "query/query.hpp"
#include "query/registry.hpp"
#include "storage/storage_bridge.hpp"

namespace cachely::query {

class QueryCache {
public:
    using Clock = std::chrono::system_clock;
    using Predicate = QueryRegistry::Predicate;

    explicit QueryCache(QueryConfig config = {},
                        std::shared_ptr<storage::StorageBridge> storage = nullptr,
                        size_t fetch_workers = 4);
    ~QueryCache();

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;

    // Process-wide cache, empty and default-configured at start-up.
    static QueryCache& instance();

    // Replace configuration and storage. Applies to queries created
    // afterwards; call before the first query, or after reset().
    void configure(QueryConfig config, std::shared_ptr<storage::StorageBridge> storage = nullptr);

    // Time source for queries created afterwards (tests).
    void set_clock(std::function<Clock::time_point()> clock);

    QueryConfig config() const;
    std::shared_ptr<storage::StorageBridge> storage() const;

    // Typed get-or-create. Lookup is by encode_key(key). Throws
    // std::invalid_argument when the key is already used by a query of a
    // different data type.
    template <typename T>
    std::shared_ptr<Query<T>> query(const nlohmann::json& key,
                                    typename Query<T>::FetchFn fetch_fn,
                                    QueryOptions<T> options = {});

    // Existing query or nullptr. Throws on a data type mismatch.
    template <typename T>
    std::shared_ptr<Query<T>> get_query(const nlohmann::json& key) const;

    // Apply `transform` to the query's data when the query exists.
    template <typename T>
    bool update_query(const nlohmann::json& key, const typename Query<T>::UpdateFn& transform);

    bool invalidate(const nlohmann::json& key);
    size_t invalidate_where(const Predicate& predicate);

    // Forced background refetch; results reach subscribers.
    bool refetch(const nlohmann::json& key);
    size_t refetch_where(const Predicate& predicate);

    // Drop a query from the registry and optionally from storage.
    bool delete_cache(const nlohmann::json& key, bool delete_storage = false);
    void delete_all(bool delete_storage = false);

    std::vector<std::shared_ptr<QueryBase>> where(const Predicate& predicate) const;
    std::vector<std::string> keys() const { return registry_.keys(); }
    size_t size() const { return registry_.size(); }

    // Empty the registry. Configuration and storage contents are kept.
    void reset();

    // Run the eviction policy once; returns evicted keys.
    std::vector<std::string> sweep();
    void set_eviction_policy(std::unique_ptr<EvictionPolicy> policy);

    // Background sweeps every `interval` until stop_gc() or destruction.
    void start_gc(std::chrono::milliseconds interval);
    void stop_gc();
    bool gc_running() const;

private:
    std::shared_ptr<const QueryContext> context() const;
    void gc_loop(std::chrono::milliseconds interval);

    std::shared_ptr<FetchPool> pool_;
    QueryRegistry registry_;

    mutable std::mutex context_mutex_;
    std::shared_ptr<const QueryContext> context_;

    mutable std::mutex gc_mutex_;
    std::condition_variable gc_cv_;
    std::unique_ptr<EvictionPolicy> eviction_policy_;
    std::thread gc_thread_;
    bool gc_stopping_ = false;
};

template <typename T>
std::shared_ptr<Query<T>> QueryCache::query(const nlohmann::json& key,
                                            typename Query<T>::FetchFn fetch_fn,
                                            QueryOptions<T> options) {
    auto encoded = encode_key(key);
    auto ctx = context();

    auto entry = registry_.get_or_create(encoded, [&]() -> std::shared_ptr<QueryBase> {
        return std::make_shared<Query<T>>(encoded, std::move(fetch_fn), std::move(options), ctx);
    });

    auto typed = std::dynamic_pointer_cast<Query<T>>(entry);
    if (!typed) {
        throw std::invalid_argument("query " + encoded + " already exists with a different data type");
    }
    return typed;
}

template <typename T>
std::shared_ptr<Query<T>> QueryCache::get_query(const nlohmann::json& key) const {
    auto encoded = encode_key(key);
    auto entry = registry_.get(encoded);
    if (!entry) {
        return nullptr;
    }

    auto typed = std::dynamic_pointer_cast<Query<T>>(entry);
    if (!typed) {
        throw std::invalid_argument("query " + encoded + " holds a different data type");
    }
    return typed;
}

template <typename T>
bool QueryCache::update_query(const nlohmann::json& key, const typename Query<T>::UpdateFn& transform) {
    auto query = get_query<T>(key);
    if (!query) {
        return false;
    }
    query->update(transform);
    return true;
}

} // namespace cachely::query
