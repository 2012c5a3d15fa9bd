#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cachely::core::config {

// Split one line of a .env file into key and value.
// Blank lines, comments and lines without '=' yield nullopt.
std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line);

// Load variables from the first .env file found under `search_paths`
// (the working directory and its two parents when empty). Variables already
// present in the environment are left alone. Returns how many were set.
std::size_t load_dotenv(const std::vector<std::filesystem::path>& search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

} // namespace cachely::core::config
