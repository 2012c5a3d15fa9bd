#include "query/state.hpp"
#include <stdexcept>

namespace cachely::query {

const char* query_status_to_string(QueryStatus status) {
    switch (status) {
        case QueryStatus::IDLE:    return "idle";
        case QueryStatus::LOADING: return "loading";
        case QueryStatus::SUCCESS: return "success";
        case QueryStatus::ERROR:   return "error";
        default: return "unknown";
    }
}

QueryStatus query_status_from_string(const std::string& str) {
    if (str == "loading") return QueryStatus::LOADING;
    if (str == "success") return QueryStatus::SUCCESS;
    if (str == "error")   return QueryStatus::ERROR;
    return QueryStatus::IDLE;
}

std::string describe_exception(const std::exception_ptr& error) {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s;
    } catch (...) {
        return "unknown error";
    }
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(millis)));
}

} // namespace cachely::query
