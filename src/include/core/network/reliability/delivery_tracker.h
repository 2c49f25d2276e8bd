#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lanlink::core {

enum class DeliveryOutcome {
    kPositive, // ACK
    kNegative, // NACK
    kTimedOut,
};

// Correlates inbound ACK/NACK frames with the outbound operation waiting for them.
//
// Senders block in Await() on a condition variable that the inbound path signals from
// RecordPositive()/RecordNegative(). Outcomes recorded for ids nobody is waiting on are
// kept for a while (the waiter might arrive late) and then pruned.
class DeliveryTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit DeliveryTracker(Clock::duration unclaimed_retention = std::chrono::seconds(60));

    // Registers interest in ack_id and drops any stale outcome recorded for it
    void Expect(const std::string& ack_id);

    // Waits until an outcome is recorded for ack_id or the timeout elapses. Calls Expect()
    // first unless ack_id is already expected, so that an outcome arriving between two
    // attempts of the same operation is not lost. A resolved outcome is consumed.
    DeliveryOutcome Await(const std::string& ack_id, std::chrono::milliseconds timeout);

    // Drops the registration and any outcome for ack_id
    void Forget(const std::string& ack_id);

    // Last writer wins until a waiter consumes the outcome
    void RecordPositive(const std::string& ack_id);
    void RecordNegative(const std::string& ack_id);

    // Wakes all waiters; every current and later Await() returns without waiting
    void Cancel();
    bool cancelled() const;

    // Sleeps for `duration` unless Cancel() is called first; true when cancelled
    bool WaitForCancel(std::chrono::milliseconds duration);

    std::size_t size() const;

private:
    struct Slot {
        std::optional<bool> positive;
        bool expected = false;
        Clock::time_point updated;
    };

    void record(const std::string& ack_id, bool positive);
    void pruneUnclaimed(Clock::time_point now);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Slot> slots_;
    Clock::duration unclaimed_retention_;
    bool cancelled_ = false;
};

} // namespace lanlink::core
