#pragma once

#include <chrono>
#include <core/constant/protocol.h>
#include <core/model/send_result.h>
#include <core/network/reliability/delivery_tracker.h>
#include <core/network/transport/transport.h>
#include <string>

namespace lanlink::core {

struct ReliabilityOptions {
    std::chrono::milliseconds ack_timeout = protocol::kAckTimeout;
    std::chrono::milliseconds retry_backoff = protocol::kRetryBackoff;
    int max_retries = protocol::kMaxRetries;
};

// Stop-and-wait retransmission: send, wait for the acknowledgment, back off, repeat.
//
// Every outbound TALK, FILE, CHUNK and END goes through Deliver(). A NACK ends the
// operation at once; only silence is retried, at most max_retries sends in total.
class ReliableSender {
public:
    ReliableSender(Transport& transport,
                   DeliveryTracker& tracker,
                   ReliabilityOptions options = {});

    // Blocks the calling thread. Returns kSuccess, kRejected, kTimedOut or kAborted (the
    // tracker was cancelled during shutdown).
    SendResult Deliver(const std::string& ack_id,
                       const std::string& payload,
                       const Endpoint& target);

    const ReliabilityOptions& options() const { return options_; }

private:
    Transport& transport_;
    DeliveryTracker& tracker_;
    ReliabilityOptions options_;
};

} // namespace lanlink::core
