#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace cachely::core::config {

namespace {

std::string trim(const std::string& value, const char* whitespace = " \t\r\n") {
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) return {};
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

std::vector<std::filesystem::path> default_search_paths() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return roots;
    }
    roots.push_back(cwd);
    if (cwd.has_parent_path() && cwd.parent_path() != cwd) {
        roots.push_back(cwd.parent_path());
        auto grandparent = cwd.parent_path().parent_path();
        if (grandparent != cwd.parent_path()) {
            roots.push_back(grandparent);
        }
    }
    return roots;
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line) {
    std::string content = trim(line);
    if (content.empty() || content[0] == '#') {
        return std::nullopt;
    }

    // Tolerate shell-style "export KEY=value"
    if (content.rfind("export ", 0) == 0) {
        content = trim(content.substr(7));
    }

    size_t eq_pos = content.find('=');
    if (eq_pos == std::string::npos) {
        return std::nullopt;
    }

    std::string key = trim(content.substr(0, eq_pos), " \t");
    std::string value = trim(content.substr(eq_pos + 1));
    if (key.empty()) {
        return std::nullopt;
    }

    if (value.size() >= 2) {
        char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return std::make_pair(key, value);
}

std::size_t load_dotenv(const std::vector<std::filesystem::path>& search_paths) {
    auto roots = search_paths.empty() ? default_search_paths() : search_paths;

    for (const auto& base : roots) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        if (!file.is_open()) {
            spdlog::warn("Unable to open {}", env_path.string());
            continue;
        }

        std::size_t applied = 0;
        std::string line;
        while (std::getline(file, line)) {
            auto entry = parse_env_line(line);
            if (!entry) continue;
            if (std::getenv(entry->first.c_str()) != nullptr) continue;
            if (setenv(entry->first.c_str(), entry->second.c_str(), 0) == 0) {
                ++applied;
            }
        }
        spdlog::debug("Loaded {} variable(s) from {}", applied, env_path.string());
        return applied;
    }
    return 0;
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

} // namespace cachely::core::config
