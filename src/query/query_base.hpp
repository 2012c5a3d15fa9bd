#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include "query/context.hpp"

namespace cachely::query {

class Subscription;

// Durations and flags of one query after per-query overrides are applied.
struct QuerySettings {
    std::chrono::milliseconds refetch_duration{0};
    std::chrono::milliseconds cache_duration{0};
    bool ignore_refetch_duration = false;
    bool ignore_cache_duration = false;
    bool store_query = false;
};

// Consistent view of what the eviction policy needs to know.
struct QueryActivity {
    size_t subscribers = 0;
    bool fetching = false;
    std::chrono::system_clock::time_point last_active;
};

/**
 * Type-independent part of a query.
 *
 * The registry stores queries through this interface so entries of different
 * data types can live in one map. The mutex guards the derived query's
 * state as well as the fields below.
 */
class QueryBase : public std::enable_shared_from_this<QueryBase> {
public:
    virtual ~QueryBase() = default;

    QueryBase(const QueryBase&) = delete;
    QueryBase& operator=(const QueryBase&) = delete;

    const std::string& key() const { return key_; }
    const QuerySettings& settings() const { return settings_; }

    size_t subscriber_count() const;
    bool is_fetching() const;
    QueryActivity activity() const;

    // Mark the cached data stale. The next resolve() fetches even when the
    // data is younger than refetch_duration.
    void invalidate();
    bool is_invalidated() const;

    // Start a forced refetch on the fetch pool and return immediately.
    // The outcome is only observable through subscribers and state().
    virtual void refetch_in_background() = 0;

protected:
    QueryBase(std::string key, QuerySettings settings, std::shared_ptr<const QueryContext> context);

    std::chrono::system_clock::time_point now() const { return context_->now(); }

    // Callers hold mutex_
    void touch_locked() { last_active_ = now(); }

    // Detach a subscriber; no-op for unknown ids
    virtual void unsubscribe(uint64_t subscriber_id) = 0;

    const std::string key_;
    const QuerySettings settings_;
    const std::shared_ptr<const QueryContext> context_;

    mutable std::mutex mutex_;
    size_t subscriber_count_ = 0;
    bool fetching_ = false;
    bool invalidated_ = false;
    std::chrono::system_clock::time_point last_active_;

    friend class Subscription;
};

} // namespace cachely::query
