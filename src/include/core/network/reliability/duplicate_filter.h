#pragma once

#include <chrono>
#include <deque>
#include <string>
#include <unordered_set>
#include <utility>

namespace lanlink::core {

// Message ids already handled, retained for a sliding time window so that a
// retransmission is recognised while the sender may still be retrying.
//
// Not synchronized: only the inbound listening loop touches it.
class DuplicateFilter {
public:
    using Clock = std::chrono::steady_clock;

    explicit DuplicateFilter(Clock::duration retention);

    bool Seen(const std::string& id) const;

    // Records the id and evicts ids older than the retention window
    void Mark(const std::string& id, Clock::time_point now = Clock::now());

    std::size_t size() const { return seen_ids_.size(); }

private:
    void evictExpired(Clock::time_point now);

    Clock::duration retention_;
    std::unordered_set<std::string> seen_ids_;
    std::deque<std::pair<Clock::time_point, std::string>> arrival_order_;
};

} // namespace lanlink::core
