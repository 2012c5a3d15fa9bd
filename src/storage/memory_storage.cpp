#include "storage/memory_storage.hpp"

namespace cachely::storage {

MemoryStorage::MemoryStorage(std::optional<std::chrono::milliseconds> ttl)
    : ttl_(ttl) {}

std::optional<nlohmann::json> MemoryStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key);
    if (it == store_.end()) {
        return std::nullopt;
    }
    if (it->second.is_expired()) {
        store_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

bool MemoryStorage::set(const std::string& key, const nlohmann::json& value) {
    if (key.empty()) {
        return false;
    }

    StoredValue entry;
    entry.value = value;
    if (ttl_.has_value()) {
        entry.expires_at = std::chrono::steady_clock::now() + *ttl_;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    store_[key] = std::move(entry);
    return true;
}

bool MemoryStorage::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.erase(key) > 0;
}

void MemoryStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.clear();
}

std::vector<std::string> MemoryStorage::keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;
    for (auto it = store_.begin(); it != store_.end(); ) {
        if (it->second.is_expired()) {
            it = store_.erase(it);
            continue;
        }
        if (prefix.empty() || it->first.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(it->first);
        }
        ++it;
    }
    return keys;
}

size_t MemoryStorage::size() {
    return keys().size();
}

} // namespace cachely::storage
