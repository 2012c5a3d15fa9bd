#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "query/eviction.hpp"
#include "query/query_base.hpp"

namespace cachely::query {

// Encoded key -> query. The only place queries are created, so there is
// never more than one query per key.
class QueryRegistry {
public:
    using Factory = std::function<std::shared_ptr<QueryBase>()>;
    using Predicate = std::function<bool(const QueryBase&)>;

    // Existing entry, or the result of `factory` inserted under the same
    // lock. Concurrent callers for one new key all receive the same query.
    std::shared_ptr<QueryBase> get_or_create(const std::string& key, const Factory& factory);

    // nullptr when absent
    std::shared_ptr<QueryBase> get(const std::string& key) const;

    // Detach the entry; the next get_or_create() builds a fresh query.
    bool remove(const std::string& key);

    std::vector<std::shared_ptr<QueryBase>> where(const Predicate& predicate) const;
    std::vector<std::string> keys() const;
    size_t size() const;
    void clear();

    // Remove every entry `policy` approves; returns the removed keys.
    std::vector<std::string> sweep(const EvictionPolicy& policy, std::chrono::system_clock::time_point now);

private:
    std::unordered_map<std::string, std::shared_ptr<QueryBase>> queries_;
    mutable std::mutex mutex_;
};

} // namespace cachely::query
