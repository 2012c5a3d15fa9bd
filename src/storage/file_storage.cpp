#include "storage/file_storage.hpp"
#include <fstream>
#include <string>
#include <spdlog/spdlog.h>

namespace cachely::storage {

FileStorage::FileStorage(std::filesystem::path path)
    : path_(std::move(path)) {
    load();
}

void FileStorage::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("Storage file {} does not exist yet", path_.string());
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        spdlog::warn("Unable to open storage file {}", path_.string());
        return;
    }

    auto parsed = nlohmann::json::parse(file, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::warn("Ignoring corrupt storage file {}", path_.string());
        return;
    }

    document_ = std::move(parsed);
    spdlog::debug("Loaded {} stored entries from {}", document_.size(), path_.string());
}

std::optional<nlohmann::json> FileStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_.find(key);
    if (it == document_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool FileStorage::set(const std::string& key, const nlohmann::json& value) {
    if (key.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_.find(key);
    std::optional<nlohmann::json> previous;
    if (it != document_.end()) {
        previous = *it;
    }

    document_[key] = value;
    if (flush_locked()) {
        return true;
    }

    // keep memory consistent with disk
    if (previous) {
        document_[key] = std::move(*previous);
    } else {
        document_.erase(key);
    }
    return false;
}

bool FileStorage::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_.find(key);
    if (it == document_.end()) {
        return false;
    }

    nlohmann::json previous = *it;
    document_.erase(it);
    if (flush_locked()) {
        return true;
    }
    document_[key] = std::move(previous);
    return false;
}

void FileStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    document_ = nlohmann::json::object();
    if (!flush_locked()) {
        spdlog::warn("Failed to clear storage file {}", path_.string());
    }
}

bool FileStorage::flush_locked() {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::warn("Cannot create {}: {}", path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::string contents;
    try {
        contents = document_.dump();
    } catch (const nlohmann::json::exception& e) {
        // e.g. invalid UTF-8 in a stored string
        spdlog::warn("Cannot serialize storage file {}: {}", path_.string(), e.what());
        return false;
    }

    auto tmp_path = path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::warn("Cannot write storage file {}", tmp_path.string());
            return false;
        }
        out << contents;
        out.flush();
        if (!out) {
            spdlog::warn("Short write to storage file {}", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        spdlog::warn("Cannot replace {}: {}", path_.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace cachely::storage
