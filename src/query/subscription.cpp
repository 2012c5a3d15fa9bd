#include "query/subscription.hpp"
#include "query/query_base.hpp"

namespace cachely::query {

Subscription::Subscription(std::weak_ptr<QueryBase> query, uint64_t id)
    : query_(std::move(query))
    , id_(id) {}

Subscription::~Subscription() {
    detach();
}

Subscription::Subscription(Subscription&& other) noexcept
    : query_(std::move(other.query_))
    , id_(other.id_) {
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        detach();
        query_ = std::move(other.query_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::detach() {
    if (id_ == 0) {
        return;
    }
    if (auto query = query_.lock()) {
        query->unsubscribe(id_);
    }
    query_.reset();
    id_ = 0;
}

bool Subscription::active() const {
    return id_ != 0 && !query_.expired();
}

} // namespace cachely::query
