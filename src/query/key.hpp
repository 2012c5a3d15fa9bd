#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace cachely::query {

// Canonical registry/storage identity of a query key.
//
// nlohmann::json keeps object members sorted, so {"id": 1, "page": 2} and
// {"page": 2, "id": 1} encode to the same string. Plain strings encode
// quoted: "todos" -> "\"todos\"".
std::string encode_key(const nlohmann::json& key);

} // namespace cachely::query
