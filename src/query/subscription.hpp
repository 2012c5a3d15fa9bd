#pragma once
#include <cstdint>
#include <memory>

namespace cachely::query {

class QueryBase;

// Handle returned by Query<T>::subscribe(). Detaches on destruction.
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<QueryBase> query, uint64_t id);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Stop receiving snapshots. Safe to repeat and to call from inside the
    // subscriber callback.
    // Does not wait for another thread's delivery in progress: a callback
    // already running, or about to run, there may still finish after
    // detach() returns. Later snapshots are not delivered.
    void detach();

    bool active() const;
    uint64_t id() const { return id_; }

private:
    std::weak_ptr<QueryBase> query_;
    uint64_t id_ = 0;
};

} // namespace cachely::query
