#include <core/network/reliability/duplicate_filter.h>

namespace lanlink::core {

DuplicateFilter::DuplicateFilter(Clock::duration retention)
    : retention_(retention) {}

bool DuplicateFilter::Seen(const std::string& id) const {
    return seen_ids_.contains(id);
}

void DuplicateFilter::Mark(const std::string& id, Clock::time_point now) {
    evictExpired(now);
    if (seen_ids_.insert(id).second) {
        arrival_order_.emplace_back(now, id);
    }
}

void DuplicateFilter::evictExpired(Clock::time_point now) {
    while (!arrival_order_.empty() && now - arrival_order_.front().first > retention_) {
        seen_ids_.erase(arrival_order_.front().second);
        arrival_order_.pop_front();
    }
}

} // namespace lanlink::core
