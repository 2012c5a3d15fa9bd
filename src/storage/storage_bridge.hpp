#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cachely::storage {

/**
 * Durable key-value persistence used by queries as a cold-start fallback.
 *
 * Keys are encoded query keys, values are serialized snapshots. Queries treat
 * every failure (a false return or an exception) as non-fatal, so backends
 * may throw on I/O errors. Implementations must be safe to call from several
 * threads at once.
 */
class StorageBridge {
public:
    virtual ~StorageBridge() = default;

    // Stored value for `key`, nullopt when nothing is stored
    virtual std::optional<nlohmann::json> get(const std::string& key) = 0;

    virtual bool set(const std::string& key, const nlohmann::json& value) = 0;

    // True when something was removed
    virtual bool erase(const std::string& key) = 0;

    virtual void clear() = 0;
};

} // namespace cachely::storage
