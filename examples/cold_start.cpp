// Shows a query restoring its last value from disk while the slow fetch
// runs. Start it twice: the second run prints the stored value first.
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include "core/logger.hpp"
#include "query/config.hpp"
#include "query/query_cache.hpp"
#include "storage/file_storage.hpp"

using namespace cachely;

int main(int argc, char** argv) {
    core::init_logger();

    std::string storage_path = argc > 1 ? argv[1] : "cachely-example.json";

    query::QueryConfig config;
    try {
        config = query::config_from_env();
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    auto storage = std::make_shared<storage::FileStorage>(storage_path);
    query::QueryCache cache(config, storage);

    auto started = std::chrono::system_clock::now();
    auto counter = cache.query<int>(
        nlohmann::json{{"resource", "counter"}},
        [started]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                started.time_since_epoch()).count();
            return static_cast<int>(seconds % 1000);
        });

    auto subscription = counter->subscribe([](const query::QueryState<int>& state) {
        std::cout << "[" << query::query_status_to_string(state.status) << "] ";
        if (state.data) {
            std::cout << "data=" << *state.data;
        } else {
            std::cout << "no data";
        }
        if (state.is_error()) {
            std::cout << " error=" << state.error_message();
        }
        std::cout << std::endl;
    });

    auto result = counter->resolve();
    if (!result.is_success()) {
        spdlog::error("Fetch failed: {}", result.error_message());
        return 1;
    }

    // second call is answered from memory
    counter->resolve();
    subscription.detach();

    spdlog::info("Stored in {}", storage->path().string());
    return 0;
}
