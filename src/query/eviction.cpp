#include "query/eviction.hpp"

namespace cachely::query {

bool IdleEvictionPolicy::should_evict(const QueryBase& query, std::chrono::system_clock::time_point now) const {
    const auto& settings = query.settings();
    if (settings.ignore_cache_duration) {
        return false;
    }

    auto activity = query.activity();
    if (activity.subscribers > 0 || activity.fetching) {
        return false;
    }
    return now - activity.last_active > settings.cache_duration;
}

} // namespace cachely::query
