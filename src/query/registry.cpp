#include "query/registry.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace cachely::query {

std::shared_ptr<QueryBase> QueryRegistry::get_or_create(const std::string& key, const Factory& factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queries_.find(key);
    if (it != queries_.end()) {
        return it->second;
    }

    auto query = factory();
    if (!query) {
        throw std::invalid_argument("query factory for " + key + " returned null");
    }
    queries_.emplace(key, query);
    spdlog::debug("Query {} registered ({} total)", key, queries_.size());
    return query;
}

std::shared_ptr<QueryBase> QueryRegistry::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queries_.find(key);
    return (it != queries_.end()) ? it->second : nullptr;
}

bool QueryRegistry::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queries_.erase(key) == 0) {
        return false;
    }
    spdlog::debug("Query {} removed", key);
    return true;
}

std::vector<std::shared_ptr<QueryBase>> QueryRegistry::where(const Predicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<QueryBase>> result;
    for (const auto& [_, query] : queries_) {
        if (!predicate || predicate(*query)) {
            result.push_back(query);
        }
    }
    return result;
}

std::vector<std::string> QueryRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(queries_.size());
    for (const auto& [key, _] : queries_) {
        result.push_back(key);
    }
    return result;
}

size_t QueryRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_.size();
}

void QueryRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_.clear();
}

std::vector<std::string> QueryRegistry::sweep(const EvictionPolicy& policy, std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> evicted;
    for (auto it = queries_.begin(); it != queries_.end(); ) {
        if (policy.should_evict(*it->second, now)) {
            evicted.push_back(it->first);
            it = queries_.erase(it);
        } else {
            ++it;
        }
    }
    if (!evicted.empty()) {
        spdlog::debug("Evicted {} idle quer{}", evicted.size(), evicted.size() == 1 ? "y" : "ies");
    }
    return evicted;
}

} // namespace cachely::query
