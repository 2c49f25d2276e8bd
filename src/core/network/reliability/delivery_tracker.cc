#include <core/network/reliability/delivery_tracker.h>
#include <spdlog/spdlog.h>

namespace lanlink::core {

DeliveryTracker::DeliveryTracker(Clock::duration unclaimed_retention)
    : unclaimed_retention_(unclaimed_retention) {}

void DeliveryTracker::Expect(const std::string& ack_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[ack_id] = Slot{std::nullopt, true, Clock::now()};
}

DeliveryOutcome DeliveryTracker::Await(const std::string& ack_id,
                                       std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto it = slots_.find(ack_id); it == slots_.end() || !it->second.expected) {
        slots_[ack_id] = Slot{std::nullopt, true, Clock::now()};
    }

    cv_.wait_for(lock, timeout, [&]() {
        if (cancelled_) {
            return true;
        }
        auto it = slots_.find(ack_id);
        return it != slots_.end() && it->second.positive.has_value();
    });

    auto it = slots_.find(ack_id);
    if (it == slots_.end() || !it->second.positive.has_value()) {
        return DeliveryOutcome::kTimedOut;
    }
    bool positive = *it->second.positive;
    slots_.erase(it);
    return positive ? DeliveryOutcome::kPositive : DeliveryOutcome::kNegative;
}

void DeliveryTracker::Forget(const std::string& ack_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(ack_id);
}

void DeliveryTracker::RecordPositive(const std::string& ack_id) {
    record(ack_id, true);
}

void DeliveryTracker::RecordNegative(const std::string& ack_id) {
    record(ack_id, false);
}

void DeliveryTracker::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool DeliveryTracker::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool DeliveryTracker::WaitForCancel(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]() { return cancelled_; });
}

std::size_t DeliveryTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

void DeliveryTracker::record(const std::string& ack_id, bool positive) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        auto& slot = slots_[ack_id];
        slot.positive = positive;
        slot.updated = now;
        if (!slot.expected) {
            spdlog::debug("Outcome for {} recorded with no waiter", ack_id);
            pruneUnclaimed(now);
        }
    }
    cv_.notify_all();
}

void DeliveryTracker::pruneUnclaimed(Clock::time_point now) {
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (!it->second.expected && now - it->second.updated > unclaimed_retention_) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace lanlink::core
