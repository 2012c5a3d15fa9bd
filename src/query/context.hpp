#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include "query/config.hpp"

namespace cachely::storage {
class StorageBridge;
}

namespace cachely::query {

class FetchPool;

// Everything a query reads from the cache that created it.
struct QueryContext {
    using Clock = std::chrono::system_clock;

    QueryConfig config;
    std::shared_ptr<storage::StorageBridge> storage;
    // Owned by the QueryCache. Queries fall back to the calling thread
    // once it is gone.
    std::weak_ptr<FetchPool> pool;
    // Time source for staleness and eviction; system clock when empty
    std::function<Clock::time_point()> clock;

    Clock::time_point now() const {
        return clock ? clock() : Clock::now();
    }
};

} // namespace cachely::query
