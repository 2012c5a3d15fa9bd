#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>

namespace cachely::query {

// Per-query overrides of QueryConfig plus seeding and storage hooks.
template <typename T>
struct QueryOptions {
    std::optional<std::chrono::milliseconds> refetch_duration;
    std::optional<std::chrono::milliseconds> cache_duration;
    std::optional<bool> store_query;

    // Cached data never goes stale by age (invalidate() still applies)
    bool ignore_refetch_duration = false;
    // Never evicted by the idle eviction policy
    bool ignore_cache_duration = false;

    // Data available before the first fetch
    std::optional<T> initial_data;

    // Storage codecs. Default to nlohmann::json conversions of T.
    // A deserializer returning nullopt or throwing marks the stored value
    // unusable.
    std::function<nlohmann::json(const T&)> serialize;
    std::function<std::optional<T>(const nlohmann::json&)> deserialize;
};

} // namespace cachely::query
