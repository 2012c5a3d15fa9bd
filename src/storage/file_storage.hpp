/**
 * JSON file StorageBridge
 *
 * Keeps every entry in one JSON object on disk so queries survive a process
 * restart. The whole document is rewritten on each mutation, which suits the
 * small number of entries a client cache holds.
 */
#pragma once
#include <filesystem>
#include <mutex>
#include "storage/storage_bridge.hpp"

namespace cachely::storage {

class FileStorage : public StorageBridge {
public:
    // Loads `path` when it exists. A missing file starts empty; an unreadable
    // or corrupt one is logged and replaced on the first write.
    explicit FileStorage(std::filesystem::path path);

    std::optional<nlohmann::json> get(const std::string& key) override;
    bool set(const std::string& key, const nlohmann::json& value) override;
    bool erase(const std::string& key) override;
    void clear() override;

    const std::filesystem::path& path() const { return path_; }

private:
    void load();
    // Write document_ to a sibling temp file and rename it over path_.
    // False when the document cannot be serialized or written.
    bool flush_locked();

    std::filesystem::path path_;
    nlohmann::json document_ = nlohmann::json::object();
    std::mutex mutex_;
};

} // namespace cachely::storage
