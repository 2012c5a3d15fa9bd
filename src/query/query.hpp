#pragma once
#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "query/fetch_pool.hpp"
#include "query/options.hpp"
#include "query/query_base.hpp"
#include "query/state.hpp"
#include "query/subscription.hpp"
#include "storage/storage_bridge.hpp"

namespace cachely::query {

/**
 * Cached result of one asynchronous computation.
 *
 * resolve() answers from memory while the data is fresh and otherwise runs
 * the fetch function. At most one fetch is outstanding per query; callers
 * arriving while it runs wait for that fetch instead of starting another.
 * Every state change is pushed to subscribers in the order it happened.
 *
 * T must be copyable and, unless QueryOptions supplies codecs, convertible
 * to and from nlohmann::json.
 */
template <typename T>
class Query : public QueryBase {
public:
    using State = QueryState<T>;
    using FetchFn = std::function<T()>;
    using UpdateFn = std::function<T(const std::optional<T>&)>;
    using Callback = std::function<void(const State&)>;

    // Use QueryCache::query() instead; queries must be owned by a shared_ptr.
    Query(std::string key, FetchFn fetch_fn, QueryOptions<T> options,
          std::shared_ptr<const QueryContext> context);

    // Cached state when fresh, otherwise the outcome of a (possibly shared)
    // fetch. Runs a new fetch on the calling thread. Rethrows the fetch
    // failure when QueryConfig::should_rethrow is set.
    State resolve(bool force_refetch = false);

    // Same decision as resolve(), but a new fetch runs on the fetch pool.
    // Callers joined to one fetch share one future.
    std::shared_future<State> resolve_async(bool force_refetch = false);

    State refetch() { return resolve(true); }
    std::shared_future<State> refetch_async() { return resolve_async(true); }
    void refetch_in_background() override;

    // Local mutation outside the fetch cycle. Status and time_created are
    // kept. `transform` runs under the query lock and must not call back
    // into this query.
    State update(const UpdateFn& transform);

    // `callback` gets the current state first, then every later one.
    // The current state is delivered before subscribe() returns unless
    // another thread is delivering snapshots of this query at that moment
    // (or the caller is itself inside one of its callbacks). That thread
    // then delivers it, still ahead of any later state.
    // Callbacks run without the query lock held; they may subscribe, detach
    // or call resolve_async(), but must not block on this query's resolve().
    // Exceptions thrown by a callback are logged and dropped.
    Subscription subscribe(Callback callback);

    State state() const;

protected:
    void unsubscribe(uint64_t subscriber_id) override;

private:
    using Promise = std::promise<State>;

    struct Subscriber {
        Callback callback;
        // Sequence number of the replayed snapshot; broadcasts at or before
        // it were queued before this subscriber existed.
        uint64_t since_seq = 0;
        std::atomic<bool> active{true};
    };

    struct Emission {
        uint64_t seq = 0;
        uint64_t target = 0;  // 0 = all subscribers
        State state;
    };

    struct FetchOutcome {
        State state;
        std::exception_ptr failure;
    };

    static QuerySettings resolve_settings(const QueryOptions<T>& options,
                                          const std::shared_ptr<const QueryContext>& context);

    bool is_fresh_locked() const;
    std::shared_ptr<Promise> begin_fetch_locked();
    void run_fetch(const std::shared_ptr<Promise>& promise);
    FetchOutcome fetch_once(bool& released);
    void release_fetch_locked();
    void hydrate_from_storage();
    std::optional<T> decode_stored(const nlohmann::json& stored) const;
    void save_to_storage(const State& state);

    void emit_locked(uint64_t target = 0);
    void drain(std::unique_lock<std::mutex>& lock);

    const FetchFn fetch_fn_;
    const QueryOptions<T> options_;

    State state_;
    std::shared_future<State> in_flight_;

    std::map<uint64_t, std::shared_ptr<Subscriber>> subscribers_;
    uint64_t next_subscriber_id_ = 1;
    std::deque<Emission> emissions_;
    uint64_t next_seq_ = 1;
    bool draining_ = false;
};

template <typename T>
Query<T>::Query(std::string key, FetchFn fetch_fn, QueryOptions<T> options,
                std::shared_ptr<const QueryContext> context)
    : QueryBase(std::move(key), resolve_settings(options, context), context)
    , fetch_fn_(std::move(fetch_fn))
    , options_(std::move(options)) {
    if (!fetch_fn_) {
        throw std::invalid_argument("query " + key_ + " has no fetch function");
    }
    state_.time_created = last_active_;
    state_.data = options_.initial_data;
}

template <typename T>
QuerySettings Query<T>::resolve_settings(const QueryOptions<T>& options,
                                         const std::shared_ptr<const QueryContext>& context) {
    if (!context) {
        throw std::invalid_argument("query created without a context");
    }
    const auto& config = context->config;

    QuerySettings settings;
    settings.refetch_duration = options.refetch_duration.value_or(config.refetch_duration);
    settings.cache_duration = options.cache_duration.value_or(config.cache_duration);
    settings.ignore_refetch_duration = options.ignore_refetch_duration;
    settings.ignore_cache_duration = options.ignore_cache_duration;
    settings.store_query = options.store_query.value_or(config.store_query);
    return settings;
}

template <typename T>
QueryState<T> Query<T>::resolve(bool force_refetch) {
    std::unique_lock<std::mutex> lock(mutex_);
    touch_locked();

    if (!force_refetch && is_fresh_locked()) {
        spdlog::debug("Query {} served from cache", key_);
        State current = state_;
        emit_locked();
        drain(lock);
        return current;
    }

    if (in_flight_.valid()) {
        auto pending = in_flight_;
        lock.unlock();
        spdlog::debug("Query {} joined in-flight fetch", key_);
        return pending.get();
    }

    auto promise = begin_fetch_locked();
    auto pending = in_flight_;
    lock.unlock();

    run_fetch(promise);
    return pending.get();
}

template <typename T>
std::shared_future<QueryState<T>> Query<T>::resolve_async(bool force_refetch) {
    std::unique_lock<std::mutex> lock(mutex_);
    touch_locked();

    if (!force_refetch && is_fresh_locked()) {
        spdlog::debug("Query {} served from cache", key_);
        Promise ready;
        ready.set_value(state_);
        emit_locked();
        drain(lock);
        return ready.get_future().share();
    }

    if (in_flight_.valid()) {
        spdlog::debug("Query {} joined in-flight fetch", key_);
        return in_flight_;
    }

    auto promise = begin_fetch_locked();
    auto pending = in_flight_;
    lock.unlock();

    auto self = std::static_pointer_cast<Query<T>>(shared_from_this());
    auto pool = context_->pool.lock();
    if (!pool || !pool->submit([self, promise]() { self->run_fetch(promise); })) {
        spdlog::warn("Fetch pool unavailable, fetching query {} on the calling thread", key_);
        run_fetch(promise);
    }
    return pending;
}

template <typename T>
void Query<T>::refetch_in_background() {
    // Outcome is delivered to subscribers; nobody waits on the future.
    auto pending = resolve_async(true);
    (void)pending;
}

template <typename T>
QueryState<T> Query<T>::update(const UpdateFn& transform) {
    std::optional<State> to_store;
    State updated;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        state_.data = transform(state_.data);
        touch_locked();
        updated = state_;
        if (settings_.store_query && context_->storage && state_.status == QueryStatus::SUCCESS) {
            to_store = state_;
        }
        emit_locked();
        drain(lock);
    }

    if (to_store) {
        save_to_storage(*to_store);
    }
    return updated;
}

template <typename T>
Subscription Query<T>::subscribe(Callback callback) {
    if (!callback) {
        throw std::invalid_argument("subscriber callback for query " + key_ + " is empty");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t id = next_subscriber_id_++;

    auto subscriber = std::make_shared<Subscriber>();
    subscriber->callback = std::move(callback);
    subscriber->since_seq = next_seq_;
    subscribers_[id] = subscriber;
    ++subscriber_count_;
    touch_locked();

    emit_locked(id);
    drain(lock);
    return Subscription(weak_from_this(), id);
}

template <typename T>
void Query<T>::unsubscribe(uint64_t subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(subscriber_id);
    if (it == subscribers_.end()) {
        return;
    }
    it->second->active = false;
    subscribers_.erase(it);
    --subscriber_count_;
    touch_locked();
}

template <typename T>
QueryState<T> Query<T>::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

template <typename T>
bool Query<T>::is_fresh_locked() const {
    if (invalidated_ || state_.status == QueryStatus::ERROR || !state_.data) {
        return false;
    }
    if (settings_.ignore_refetch_duration) {
        return true;
    }
    return now() <= state_.time_created + settings_.refetch_duration;
}

template <typename T>
std::shared_ptr<std::promise<QueryState<T>>> Query<T>::begin_fetch_locked() {
    auto promise = std::make_shared<Promise>();
    in_flight_ = promise->get_future().share();
    fetching_ = true;
    return promise;
}

template <typename T>
void Query<T>::run_fetch(const std::shared_ptr<Promise>& promise) {
    bool released = false;
    FetchOutcome outcome;
    try {
        outcome = fetch_once(released);
    } catch (...) {
        // the cycle itself broke (a throwing copy of T, the clock, ...);
        // settle the query as failed so waiters and later resolves go on
        outcome.failure = std::current_exception();
        spdlog::error("Query {} fetch aborted: {}", key_, describe_exception(outcome.failure));

        std::unique_lock<std::mutex> lock(mutex_);
        if (!released) {
            state_.status = QueryStatus::ERROR;
            state_.error = outcome.failure;
            release_fetch_locked();
            emit_locked();
        }
        outcome.state = state_;
        drain(lock);
    }

    if (outcome.failure && context_->config.should_rethrow) {
        promise->set_exception(outcome.failure);
    } else {
        promise->set_value(std::move(outcome.state));
    }
}

template <typename T>
typename Query<T>::FetchOutcome Query<T>::fetch_once(bool& released) {
    bool read_storage = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        state_.status = QueryStatus::LOADING;
        state_.error = nullptr;
        read_storage = !state_.data && settings_.store_query && context_->storage;
        emit_locked();
        drain(lock);
    }
    spdlog::debug("Query {} fetching", key_);

    if (read_storage) {
        hydrate_from_storage();
    }

    std::optional<T> result;
    std::exception_ptr failure;
    try {
        result.emplace(fetch_fn_());
    } catch (...) {
        // kept in the error snapshot and handed to waiters
        failure = std::current_exception();
    }

    std::optional<State> to_store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure) {
            state_.status = QueryStatus::ERROR;
            state_.error = failure;
        } else {
            state_.data = std::move(result);
            state_.status = QueryStatus::SUCCESS;
            state_.error = nullptr;
            state_.time_created = std::max(now(), state_.time_created);
            if (settings_.store_query && context_->storage) {
                to_store = state_;
            }
        }
    }

    if (failure) {
        spdlog::error("Query {} fetch failed: {}", key_, describe_exception(failure));
    }
    if (to_store) {
        save_to_storage(*to_store);
    }

    FetchOutcome outcome;
    outcome.failure = failure;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        release_fetch_locked();
        released = true;
        outcome.state = state_;
        emit_locked();
        drain(lock);
    }
    return outcome;
}

template <typename T>
void Query<T>::release_fetch_locked() {
    in_flight_ = std::shared_future<State>();
    fetching_ = false;
    invalidated_ = false;
}

template <typename T>
void Query<T>::hydrate_from_storage() {
    std::optional<nlohmann::json> stored;
    try {
        stored = context_->storage->get(key_);
    } catch (...) {
        spdlog::warn("Storage read for query {} failed: {}", key_, describe_exception(std::current_exception()));
        return;
    }
    if (!stored) {
        return;
    }

    auto data = decode_stored(*stored);
    if (!data) {
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (state_.data) {
        return;
    }
    state_.data = std::move(data);
    spdlog::debug("Query {} restored from storage", key_);
    emit_locked();
    drain(lock);
}

template <typename T>
std::optional<T> Query<T>::decode_stored(const nlohmann::json& stored) const {
    try {
        if (!stored.is_object() || !stored.contains("data")) {
            spdlog::warn("Stored value for query {} is malformed", key_);
            return std::nullopt;
        }

        const auto& max_age = context_->config.storage_duration;
        if (max_age) {
            auto created = from_epoch_ms(stored.value("timeCreated", int64_t{0}));
            if (now() - created > *max_age) {
                spdlog::debug("Stored value for query {} is too old", key_);
                return std::nullopt;
            }
        }

        const auto& data = stored.at("data");
        if (options_.deserialize) {
            return options_.deserialize(data);
        }
        return data.get<T>();
    } catch (...) {
        spdlog::warn("Discarding stored value for query {}: {}", key_, describe_exception(std::current_exception()));
        return std::nullopt;
    }
}

template <typename T>
void Query<T>::save_to_storage(const State& state) {
    if (!state.data) {
        return;
    }
    try {
        nlohmann::json record;
        record["data"] = options_.serialize ? options_.serialize(*state.data) : nlohmann::json(*state.data);
        record["status"] = query_status_to_string(state.status);
        record["timeCreated"] = to_epoch_ms(state.time_created);

        if (!context_->storage->set(key_, record)) {
            spdlog::warn("Storage refused to persist query {}", key_);
        }
    } catch (...) {
        spdlog::warn("Storage write for query {} failed: {}", key_, describe_exception(std::current_exception()));
    }
}

template <typename T>
void Query<T>::emit_locked(uint64_t target) {
    Emission emission;
    emission.seq = next_seq_++;
    emission.target = target;
    emission.state = state_;
    emissions_.push_back(std::move(emission));
}

template <typename T>
void Query<T>::drain(std::unique_lock<std::mutex>& lock) {
    if (draining_) {
        // whoever is draining delivers this one too, in sequence order
        return;
    }
    draining_ = true;

    struct DrainGuard {
        std::unique_lock<std::mutex>& lock;
        bool& draining;
        ~DrainGuard() {
            if (!lock.owns_lock()) lock.lock();
            draining = false;
        }
    } guard{lock, draining_};

    while (!emissions_.empty()) {
        Emission emission = std::move(emissions_.front());
        emissions_.pop_front();

        std::vector<std::shared_ptr<Subscriber>> targets;
        for (const auto& [id, subscriber] : subscribers_) {
            bool wanted = emission.target == 0 ? emission.seq > subscriber->since_seq
                                               : emission.target == id;
            if (wanted) {
                targets.push_back(subscriber);
            }
        }
        if (targets.empty()) {
            continue;
        }

        lock.unlock();
        for (const auto& subscriber : targets) {
            if (!subscriber->active) continue;
            try {
                subscriber->callback(emission.state);
            } catch (...) {
                spdlog::error("Subscriber of query {} threw: {}", key_, describe_exception(std::current_exception()));
            }
        }
        lock.lock();
    }
}

} // namespace cachely::query
