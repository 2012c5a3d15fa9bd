#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "storage/storage_bridge.hpp"

namespace cachely::storage {

// Process-local StorageBridge. Entries optionally expire after a TTL.
class MemoryStorage : public StorageBridge {
public:
    explicit MemoryStorage(std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    std::optional<nlohmann::json> get(const std::string& key) override;
    bool set(const std::string& key, const nlohmann::json& value) override;
    bool erase(const std::string& key) override;
    void clear() override;

    // Live keys starting with `prefix`
    std::vector<std::string> keys(const std::string& prefix = "");
    size_t size();

private:
    struct StoredValue {
        nlohmann::json value;
        std::chrono::steady_clock::time_point expires_at;

        bool is_expired() const {
            if (expires_at == std::chrono::steady_clock::time_point{}) return false;
            return std::chrono::steady_clock::now() > expires_at;
        }
    };

    std::optional<std::chrono::milliseconds> ttl_;
    std::unordered_map<std::string, StoredValue> store_;
    std::mutex mutex_;
};

} // namespace cachely::storage
