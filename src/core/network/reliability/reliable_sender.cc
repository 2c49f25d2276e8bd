#include <core/network/reliability/reliable_sender.h>
#include <spdlog/spdlog.h>

namespace lanlink::core {

namespace {

std::string_view TypeToken(std::string_view payload) {
    return payload.substr(0, payload.find(' '));
}

} // namespace

ReliableSender::ReliableSender(Transport& transport,
                               DeliveryTracker& tracker,
                               ReliabilityOptions options)
    : transport_(transport)
    , tracker_(tracker)
    , options_(options) {}

SendResult ReliableSender::Deliver(const std::string& ack_id,
                                   const std::string& payload,
                                   const Endpoint& target) {
    tracker_.Expect(ack_id);

    for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
        if (tracker_.cancelled()) {
            tracker_.Forget(ack_id);
            return SendResult::kAborted;
        }

        spdlog::debug("Sending {} {} to {} (attempt {}/{})",
                      TypeToken(payload),
                      ack_id,
                      target.address().to_string(),
                      attempt,
                      options_.max_retries);

        if (transport_.SendTo(payload, target)) {
            switch (tracker_.Await(ack_id, options_.ack_timeout)) {
            case DeliveryOutcome::kPositive:
                return SendResult::kSuccess;
            case DeliveryOutcome::kNegative:
                spdlog::info("{} {} rejected by {}",
                             TypeToken(payload),
                             ack_id,
                             target.address().to_string());
                return SendResult::kRejected;
            case DeliveryOutcome::kTimedOut:
                break;
            }
        }

        if (attempt < options_.max_retries) {
            spdlog::debug("No acknowledgment for {}, retrying...", ack_id);
            if (tracker_.WaitForCancel(options_.retry_backoff)) {
                tracker_.Forget(ack_id);
                return SendResult::kAborted;
            }
        }
    }

    tracker_.Forget(ack_id);
    if (tracker_.cancelled()) {
        return SendResult::kAborted;
    }
    spdlog::warn("{} {} to {} not acknowledged after {} attempts",
                 TypeToken(payload),
                 ack_id,
                 target.address().to_string(),
                 options_.max_retries);
    return SendResult::kTimedOut;
}

} // namespace lanlink::core
