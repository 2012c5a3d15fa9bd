#include "query/query_base.hpp"
#include <spdlog/spdlog.h>

namespace cachely::query {

QueryBase::QueryBase(std::string key, QuerySettings settings, std::shared_ptr<const QueryContext> context)
    : key_(std::move(key))
    , settings_(settings)
    , context_(std::move(context)) {
    last_active_ = context_->now();
}

size_t QueryBase::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriber_count_;
}

bool QueryBase::is_fetching() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetching_;
}

QueryActivity QueryBase::activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueryActivity activity;
    activity.subscribers = subscriber_count_;
    activity.fetching = fetching_;
    activity.last_active = last_active_;
    return activity;
}

void QueryBase::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    invalidated_ = true;
    spdlog::debug("Query {} invalidated", key_);
}

bool QueryBase::is_invalidated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invalidated_;
}

} // namespace cachely::query
