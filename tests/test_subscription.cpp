#include <catch2/catch.hpp>
#include <atomic>
#include <stdexcept>
#include "test_helpers.hpp"

using namespace cachely;
using namespace cachely::test;
using query::QueryCache;
using query::QueryState;
using query::QueryStatus;
using query::Subscription;

TEST_CASE("Subscribers get the current state then every transition", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("numbers", []() { return 1; });

    Recorder<int> recorder;
    auto subscription = numbers->subscribe(recorder.callback());
    REQUIRE(recorder.size() == 1);
    CHECK(recorder.states()[0].is_idle());

    numbers->resolve();

    auto states = recorder.states();
    REQUIRE(states.size() == 3);
    CHECK(states[1].status == QueryStatus::LOADING);
    CHECK(states[2].status == QueryStatus::SUCCESS);
    CHECK(states[2].data == 1);
}

TEST_CASE("Cache hits are emitted as well", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("hits", []() { return 1; });
    numbers->resolve();

    Recorder<int> recorder;
    auto subscription = numbers->subscribe(recorder.callback());
    numbers->resolve();

    auto states = recorder.states();
    REQUIRE(states.size() == 2);
    CHECK(states[0].data == 1);
    CHECK(states[1].data == 1);
    CHECK(states[1].time_created == states[0].time_created);
}

TEST_CASE("All subscribers observe the same order", "[subscription]") {
    QueryCache cache;
    std::atomic<int> calls{0};
    auto numbers = cache.query<int>("ordered", [&]() { return ++calls; });

    Recorder<int> first;
    Recorder<int> second;
    auto first_subscription = numbers->subscribe(first.callback());
    auto second_subscription = numbers->subscribe(second.callback());

    numbers->resolve();
    numbers->update([](const std::optional<int>& data) { return data.value_or(0) + 100; });
    numbers->refetch();

    auto a = first.states();
    auto b = second.states();
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].status == b[i].status);
        CHECK(a[i].data == b[i].data);
    }
    CHECK(a.back().data == 2);
}

TEST_CASE("Detached subscribers receive nothing more", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("detach", []() { return 1; });

    Recorder<int> recorder;
    auto subscription = numbers->subscribe(recorder.callback());
    CHECK(numbers->subscriber_count() == 1);
    CHECK(subscription.active());

    subscription.detach();
    subscription.detach();
    CHECK_FALSE(subscription.active());
    CHECK(numbers->subscriber_count() == 0);

    numbers->resolve();
    CHECK(recorder.size() == 1);
}

TEST_CASE("Subscriptions detach when destroyed", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("scoped", []() { return 1; });

    Recorder<int> recorder;
    {
        auto subscription = numbers->subscribe(recorder.callback());
        CHECK(numbers->subscriber_count() == 1);
    }
    CHECK(numbers->subscriber_count() == 0);

    numbers->resolve();
    CHECK(recorder.size() == 1);
}

TEST_CASE("Moving a subscription keeps it attached once", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("moved", []() { return 1; });

    Recorder<int> recorder;
    auto source = numbers->subscribe(recorder.callback());
    Subscription moved = std::move(source);

    CHECK_FALSE(source.active());
    CHECK(moved.active());
    CHECK(numbers->subscriber_count() == 1);

    source.detach();
    CHECK(numbers->subscriber_count() == 1);

    moved = Subscription();
    CHECK(numbers->subscriber_count() == 0);
}

TEST_CASE("A subscriber may detach itself from its callback", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("self-detach", []() { return 1; });

    int deliveries = 0;
    Subscription subscription;
    subscription = numbers->subscribe([&](const QueryState<int>& state) {
        ++deliveries;
        if (state.is_loading()) {
            subscription.detach();
        }
    });

    numbers->resolve();

    // idle replay, then loading; success arrives after the detach
    CHECK(deliveries == 2);
    CHECK(numbers->subscriber_count() == 0);
}

TEST_CASE("Late subscribers still see the final outcome", "[subscription]") {
    QueryCache cache;
    Gate gate;
    auto slow = cache.query<int>("late", [&]() {
        gate.wait();
        return 5;
    });

    auto pending = slow->resolve_async();
    REQUIRE(slow->is_fetching());

    Recorder<int> recorder;
    auto subscription = slow->subscribe(recorder.callback());
    REQUIRE(recorder.size() >= 1);

    gate.open();
    pending.get();

    REQUIRE(eventually([&]() {
        auto states = recorder.states();
        return !states.empty() && states.back().is_success();
    }));
    CHECK(recorder.states().back().data == 5);
}

TEST_CASE("A throwing subscriber does not break the query", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("throwing", []() { return 3; });

    auto bad = numbers->subscribe([](const QueryState<int>& state) {
        if (state.is_success()) throw std::runtime_error("render failed");
    });
    Recorder<int> recorder;
    auto good = numbers->subscribe(recorder.callback());

    auto state = numbers->resolve();

    CHECK(state.is_success());
    CHECK(recorder.states().back().data == 3);
    CHECK_FALSE(numbers->is_fetching());
}

TEST_CASE("Callbacks can read the query they observe", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("reentrant", []() { return 4; });

    std::vector<QueryStatus> observed;
    auto subscription = numbers->subscribe([&](const QueryState<int>&) {
        observed.push_back(numbers->state().status);
    });

    numbers->resolve();
    REQUIRE_FALSE(observed.empty());
    CHECK(observed.back() == QueryStatus::SUCCESS);
}

TEST_CASE("Subscriptions may outlive their query", "[subscription]") {
    Subscription subscription;
    {
        QueryCache cache;
        auto numbers = cache.query<int>("short-lived", []() { return 1; });
        subscription = numbers->subscribe([](const QueryState<int>&) {});
        CHECK(subscription.active());
    }
    CHECK_FALSE(subscription.active());
    CHECK_NOTHROW(subscription.detach());
}

TEST_CASE("Empty callbacks are rejected", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("empty-callback", []() { return 1; });
    CHECK_THROWS_AS(numbers->subscribe(nullptr), std::invalid_argument);
    CHECK(numbers->subscriber_count() == 0);
}

TEST_CASE("Subscribing during a delivery replays after that callback returns", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("nested", []() { return 9; });

    Recorder<int> inner;
    Subscription inner_subscription;
    size_t inner_seen_at_subscribe = 0;
    auto outer = numbers->subscribe([&](const QueryState<int>& state) {
        if (state.is_loading() && !inner_subscription.active()) {
            inner_subscription = numbers->subscribe(inner.callback());
            inner_seen_at_subscribe = inner.size();
        }
    });

    numbers->resolve();

    CHECK(inner_seen_at_subscribe == 0);
    auto states = inner.states();
    REQUIRE(states.size() == 2);
    CHECK(states[0].is_loading());
    CHECK(states[1].is_success());
    CHECK(states[1].data == 9);
}

TEST_CASE("detach does not wait for a callback running elsewhere", "[subscription]") {
    QueryCache cache;
    auto numbers = cache.query<int>("busy-callback", []() { return 1; });

    Gate release;
    std::atomic<bool> inside{false};
    Recorder<int> recorder;
    auto record = recorder.callback();
    auto subscription = numbers->subscribe([&](const QueryState<int>& state) {
        record(state);
        if (state.is_loading()) {
            inside = true;
            release.wait();
        }
    });

    auto pending = numbers->resolve_async();
    REQUIRE(eventually([&]() { return inside.load(); }));

    subscription.detach();
    CHECK_FALSE(subscription.active());
    CHECK(numbers->subscriber_count() == 0);

    release.open();
    CHECK(pending.get().is_success());

    auto states = recorder.states();
    REQUIRE(states.size() == 2);
    CHECK(states[0].is_idle());
    CHECK(states[1].is_loading());
}
