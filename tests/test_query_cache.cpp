#include <catch2/catch.hpp>
#include <algorithm>
#include <atomic>
#include <string>
#include "test_helpers.hpp"

using namespace cachely;
using namespace cachely::test;
using query::QueryBase;
using query::QueryCache;
using query::QueryConfig;

TEST_CASE("instance() is one process-wide cache", "[cache]") {
    auto& a = QueryCache::instance();
    auto& b = QueryCache::instance();
    CHECK(&a == &b);

    auto numbers = a.query<int>("instance-test", []() { return 11; });
    CHECK(b.get_query<int>("instance-test") == numbers);
    a.reset();
    CHECK(b.get_query<int>("instance-test") == nullptr);
}

TEST_CASE("query() hands out one query per key", "[cache]") {
    QueryCache cache;
    std::atomic<int> calls{0};
    auto fetch = [&]() { return ++calls; };

    auto first = cache.query<int>(nlohmann::json{{"todo", 1}}, fetch);
    auto second = cache.query<int>(nlohmann::json{{"todo", 1}}, fetch);
    auto other = cache.query<int>(nlohmann::json{{"todo", 2}}, fetch);

    CHECK(first == second);
    CHECK(first != other);
    CHECK(cache.size() == 2);
}

TEST_CASE("Keys with a different data type are rejected", "[cache]") {
    QueryCache cache;
    cache.query<int>("typed", []() { return 1; });

    CHECK_THROWS_AS(cache.query<std::string>("typed", []() { return std::string("x"); }),
                    std::invalid_argument);
    CHECK_THROWS_AS(cache.get_query<std::string>("typed"), std::invalid_argument);
    CHECK(cache.get_query<int>("missing") == nullptr);
}

TEST_CASE("configure() applies to queries created afterwards", "[cache]") {
    QueryCache cache;
    auto before = cache.query<int>("before", []() { return 1; });

    QueryConfig config;
    config.refetch_duration = std::chrono::milliseconds(1);
    config.should_rethrow = true;
    auto storage = std::make_shared<storage::MemoryStorage>();
    cache.configure(config, storage);

    CHECK(cache.config().refetch_duration == std::chrono::milliseconds(1));
    CHECK(cache.config().should_rethrow);
    CHECK(cache.storage() == storage);

    auto after = cache.query<int>("after", []() { return 2; });
    CHECK(before->settings().refetch_duration == std::chrono::seconds(4));
    CHECK(after->settings().refetch_duration == std::chrono::milliseconds(1));

    after->resolve();
    CHECK(storage->get(after->key()).has_value());
}

TEST_CASE("invalidate() marks queries stale", "[cache]") {
    QueryCache cache;
    std::atomic<int> calls{0};
    auto numbers = cache.query<int>("numbers", [&]() { return ++calls; });
    numbers->resolve();

    CHECK(cache.invalidate("numbers"));
    CHECK_FALSE(cache.invalidate("unknown"));
    CHECK(numbers->is_invalidated());

    CHECK(numbers->resolve().data == 2);
    CHECK_FALSE(numbers->is_invalidated());
}

TEST_CASE("invalidate_where() matches by predicate", "[cache]") {
    QueryCache cache;
    auto a = cache.query<int>(nlohmann::json{{"scope", "todos"}, {"id", 1}}, []() { return 1; });
    auto b = cache.query<int>(nlohmann::json{{"scope", "todos"}, {"id", 2}}, []() { return 2; });
    auto c = cache.query<int>(nlohmann::json{{"scope", "users"}, {"id", 1}}, []() { return 3; });

    auto count = cache.invalidate_where([](const QueryBase& q) {
        return nlohmann::json::parse(q.key()).at("scope") == "todos";
    });

    CHECK(count == 2);
    CHECK(a->is_invalidated());
    CHECK(b->is_invalidated());
    CHECK_FALSE(c->is_invalidated());
}

TEST_CASE("refetch() updates subscribers in the background", "[cache]") {
    QueryCache cache;
    std::atomic<int> calls{0};
    auto numbers = cache.query<int>("background", [&]() { return ++calls; });
    numbers->resolve();

    Recorder<int> recorder;
    auto subscription = numbers->subscribe(recorder.callback());

    CHECK(cache.refetch("background"));
    CHECK_FALSE(cache.refetch("missing"));

    REQUIRE(eventually([&]() {
        auto state = numbers->state();
        return state.is_success() && state.data == 2;
    }));
    REQUIRE(eventually([&]() { return recorder.states().back().data == 2; }));
}

TEST_CASE("refetch_where() refetches every match", "[cache]") {
    QueryCache cache;
    std::atomic<int> calls{0};
    auto a = cache.query<int>("group/a", [&]() { return ++calls; });
    auto b = cache.query<int>("group/b", [&]() { return ++calls; });
    auto other = cache.query<int>("other", []() { return 0; });

    auto count = cache.refetch_where([](const QueryBase& q) { return q.key().find("group/") != std::string::npos; });

    CHECK(count == 2);
    REQUIRE(eventually([&]() { return a->state().is_success() && b->state().is_success(); }));
    CHECK(calls == 2);
    CHECK(other->state().is_idle());
}

TEST_CASE("update_query() changes data of an existing query", "[cache]") {
    QueryCache cache;
    auto numbers = cache.query<int>("counter", []() { return 1; });
    numbers->resolve();

    CHECK(cache.update_query<int>("counter", [](const std::optional<int>& n) { return n.value_or(0) + 1; }));
    CHECK(numbers->state().data == 2);
    CHECK_FALSE(cache.update_query<int>("missing", [](const std::optional<int>&) { return 0; }));
}

TEST_CASE("delete_cache() drops the query and optionally storage", "[cache]") {
    auto storage = std::make_shared<storage::MemoryStorage>();
    QueryCache cache(QueryConfig{}, storage);

    auto kept = cache.query<int>("kept-in-storage", []() { return 1; });
    auto dropped = cache.query<int>("dropped", []() { return 2; });
    kept->resolve();
    dropped->resolve();
    REQUIRE(storage->size() == 2);

    CHECK(cache.delete_cache("kept-in-storage"));
    CHECK(cache.get_query<int>("kept-in-storage") == nullptr);
    CHECK(storage->get(kept->key()).has_value());

    CHECK(cache.delete_cache("dropped", true));
    CHECK_FALSE(storage->get(dropped->key()).has_value());

    CHECK_FALSE(cache.delete_cache("never-existed"));
}

TEST_CASE("A query recreated after deletion recovers from storage", "[cache]") {
    auto storage = std::make_shared<storage::MemoryStorage>();
    QueryCache cache(QueryConfig{}, storage);
    cache.query<int>("persisted", []() { return 5; })->resolve();
    cache.delete_cache("persisted");

    Gate gate;
    auto recreated = cache.query<int>("persisted", [&]() {
        gate.wait();
        return 6;
    });
    auto pending = recreated->resolve_async();

    REQUIRE(eventually([&]() { return recreated->state().data == 5; }));
    CHECK(recreated->state().is_loading());

    gate.open();
    CHECK(pending.get().data == 6);
}

TEST_CASE("delete_all() empties the cache", "[cache]") {
    auto storage = std::make_shared<storage::MemoryStorage>();
    QueryCache cache(QueryConfig{}, storage);
    cache.query<int>("a", []() { return 1; })->resolve();
    cache.query<int>("b", []() { return 2; })->resolve();

    cache.delete_all();
    CHECK(cache.size() == 0);
    CHECK(storage->size() == 2);

    cache.query<int>("c", []() { return 3; })->resolve();
    cache.delete_all(true);
    CHECK(cache.size() == 0);
    CHECK(storage->size() == 0);
}

TEST_CASE("where() and keys() list registered queries", "[cache]") {
    QueryCache cache;
    auto watched = cache.query<int>("watched", []() { return 1; });
    cache.query<int>("unwatched", []() { return 2; });
    auto subscription = watched->subscribe([](const query::QueryState<int>&) {});

    auto matches = cache.where([](const QueryBase& q) { return q.subscriber_count() > 0; });
    REQUIRE(matches.size() == 1);
    CHECK(matches.front() == watched);
    CHECK(cache.where(nullptr).size() == 2);

    auto keys = cache.keys();
    CHECK(keys.size() == 2);
    CHECK(std::find(keys.begin(), keys.end(), query::encode_key("watched")) != keys.end());
}

TEST_CASE("reset() keeps configuration and storage", "[cache]") {
    auto storage = std::make_shared<storage::MemoryStorage>();
    QueryConfig config;
    config.cache_duration = std::chrono::seconds(9);
    QueryCache cache(config, storage);
    cache.query<int>("a", []() { return 1; })->resolve();

    cache.reset();

    CHECK(cache.size() == 0);
    CHECK(cache.config().cache_duration == std::chrono::seconds(9));
    CHECK(cache.storage() == storage);
    CHECK(storage->size() == 1);
}
