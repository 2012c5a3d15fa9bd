#include "query/config.hpp"
#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace cachely::query {

namespace {

std::chrono::milliseconds parse_millis(const std::string& name, const std::string& raw) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": expected milliseconds, got '" + raw + "'");
    }
    if (consumed != raw.size() || value < 0) {
        throw std::invalid_argument(name + ": expected non-negative milliseconds, got '" + raw + "'");
    }
    return std::chrono::milliseconds(value);
}

bool parse_bool(const std::string& name, std::string raw) {
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return true;
    if (raw == "0" || raw == "false" || raw == "no" || raw == "off") return false;
    throw std::invalid_argument(name + ": expected a boolean, got '" + raw + "'");
}

std::chrono::milliseconds json_millis(const nlohmann::json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw std::invalid_argument(std::string(field) + " must be a non-negative integer");
    }
    return std::chrono::milliseconds(value.get<long long>());
}

bool json_bool(const nlohmann::json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_boolean()) {
        throw std::invalid_argument(std::string(field) + " must be a boolean");
    }
    return value.get<bool>();
}

} // namespace

QueryConfig config_from_env() {
    core::config::load_dotenv();

    QueryConfig config;
    auto refetch = core::config::get_env("CACHELY_REFETCH_MS");
    if (!refetch.empty()) {
        config.refetch_duration = parse_millis("CACHELY_REFETCH_MS", refetch);
    }
    auto cache = core::config::get_env("CACHELY_CACHE_MS");
    if (!cache.empty()) {
        config.cache_duration = parse_millis("CACHELY_CACHE_MS", cache);
    }
    auto rethrow = core::config::get_env("CACHELY_SHOULD_RETHROW");
    if (!rethrow.empty()) {
        config.should_rethrow = parse_bool("CACHELY_SHOULD_RETHROW", rethrow);
    }
    auto store = core::config::get_env("CACHELY_STORE_QUERY");
    if (!store.empty()) {
        config.store_query = parse_bool("CACHELY_STORE_QUERY", store);
    }
    auto storage = core::config::get_env("CACHELY_STORAGE_DURATION_MS");
    if (!storage.empty()) {
        config.storage_duration = parse_millis("CACHELY_STORAGE_DURATION_MS", storage);
    }

    spdlog::debug("Query config from env: {}", config_to_json(config).dump());
    return config;
}

QueryConfig config_from_json(const nlohmann::json& j, QueryConfig base) {
    if (!j.is_object()) {
        throw std::invalid_argument("query config must be a json object");
    }
    if (j.contains("refetchDurationMs")) {
        base.refetch_duration = json_millis(j, "refetchDurationMs");
    }
    if (j.contains("cacheDurationMs")) {
        base.cache_duration = json_millis(j, "cacheDurationMs");
    }
    if (j.contains("shouldRethrow")) {
        base.should_rethrow = json_bool(j, "shouldRethrow");
    }
    if (j.contains("storeQuery")) {
        base.store_query = json_bool(j, "storeQuery");
    }
    if (j.contains("storageDurationMs")) {
        if (j.at("storageDurationMs").is_null()) {
            base.storage_duration.reset();
        } else {
            base.storage_duration = json_millis(j, "storageDurationMs");
        }
    }
    return base;
}

nlohmann::json config_to_json(const QueryConfig& config) {
    nlohmann::json j;
    j["refetchDurationMs"] = config.refetch_duration.count();
    j["cacheDurationMs"] = config.cache_duration.count();
    j["shouldRethrow"] = config.should_rethrow;
    j["storeQuery"] = config.store_query;
    if (config.storage_duration) {
        j["storageDurationMs"] = config.storage_duration->count();
    } else {
        j["storageDurationMs"] = nullptr;
    }
    return j;
}

} // namespace cachely::query
