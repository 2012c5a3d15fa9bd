#pragma once
#include <chrono>
#include "query/query_base.hpp"

namespace cachely::query {

// Decides which registry entries a sweep may drop.
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;
    virtual bool should_evict(const QueryBase& query, std::chrono::system_clock::time_point now) const = 0;
};

// Evicts queries nobody subscribes to and nobody has touched for longer
// than their cache_duration. Queries with a fetch in flight or with
// ignore_cache_duration set are kept.
class IdleEvictionPolicy : public EvictionPolicy {
public:
    bool should_evict(const QueryBase& query, std::chrono::system_clock::time_point now) const override;
};

} // namespace cachely::query
