#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace cachely::query {

// Lifecycle of a query: IDLE -> LOADING -> {SUCCESS, ERROR}, and back to
// LOADING on every refetch.
enum class QueryStatus {
    IDLE,
    LOADING,
    SUCCESS,
    ERROR
};

const char* query_status_to_string(QueryStatus status);

// Unknown names map to IDLE
QueryStatus query_status_from_string(const std::string& str);

// what() of a captured exception, or a placeholder for non-standard ones.
// Empty when `error` is null.
std::string describe_exception(const std::exception_ptr& error);

int64_t to_epoch_ms(std::chrono::system_clock::time_point time);
std::chrono::system_clock::time_point from_epoch_ms(int64_t millis);

/**
 * Point-in-time result of a query.
 *
 * SUCCESS always carries data and ERROR always carries an error. Data is kept
 * across failed fetches so consumers can show the last good value next to the
 * error. time_created is the moment the data was last produced by a
 * successful fetch (creation time until the first one succeeds).
 */
template <typename T>
struct QueryState {
    std::optional<T> data;
    QueryStatus status = QueryStatus::IDLE;
    std::exception_ptr error;
    std::chrono::system_clock::time_point time_created;

    bool has_data() const { return data.has_value(); }
    bool is_idle() const { return status == QueryStatus::IDLE; }
    bool is_loading() const { return status == QueryStatus::LOADING; }
    bool is_success() const { return status == QueryStatus::SUCCESS; }
    bool is_error() const { return status == QueryStatus::ERROR; }

    std::string error_message() const { return describe_exception(error); }
};

} // namespace cachely::query
