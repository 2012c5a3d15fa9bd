#pragma once
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

namespace cachely::query {

// Cache-wide defaults. Every query reads these unless its QueryOptions
// override them.
struct QueryConfig {
    // Minimum age before cached data is considered stale
    std::chrono::milliseconds refetch_duration = std::chrono::seconds(4);
    // How long an unsubscribed query may stay in the registry
    std::chrono::milliseconds cache_duration = std::chrono::minutes(5);
    // Re-raise fetch failures to callers of resolve()
    bool should_rethrow = false;
    // Persist query results through the StorageBridge
    bool store_query = true;
    // Stored snapshots older than this are ignored on cold start
    std::optional<std::chrono::milliseconds> storage_duration;
};

// Defaults overlaid with CACHELY_REFETCH_MS, CACHELY_CACHE_MS,
// CACHELY_SHOULD_RETHROW, CACHELY_STORE_QUERY and
// CACHELY_STORAGE_DURATION_MS. A .env file is consulted first.
// Throws std::invalid_argument on malformed values.
QueryConfig config_from_env();

// Overlay the keys present in `j` (refetchDurationMs, cacheDurationMs,
// shouldRethrow, storeQuery, storageDurationMs) on `base`.
// Throws std::invalid_argument on wrong types or negative durations.
QueryConfig config_from_json(const nlohmann::json& j, QueryConfig base = {});

nlohmann::json config_to_json(const QueryConfig& config);

} // namespace cachely::query
