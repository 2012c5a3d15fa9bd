#include "query/key.hpp"
#include <stdexcept>

namespace cachely::query {

std::string encode_key(const nlohmann::json& key) {
    if (key.is_discarded()) {
        throw std::invalid_argument("query key is a discarded json value");
    }
    // strict UTF-8 handling keeps encodings stable across callers
    return key.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

} // namespace cachely::query
