#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

namespace lanlink::core {

enum class SendResult {
    kSuccess,       // acknowledged by the peer
    kQueued,        // file transfer handed off to its own thread
    kRejected,      // peer answered with NACK
    kTimedOut,      // retry budget exhausted without ACK or NACK
    kUnknownDevice, // target name not in the device registry
    kFileNotFound,  // local file missing or not a regular file
    kAborted,       // shutdown requested while in flight
    kFailed,        // local I/O error
};

NLOHMANN_JSON_SERIALIZE_ENUM(SendResult,
                             {
                                 {SendResult::kSuccess, "Success"},
                                 {SendResult::kQueued, "Queued"},
                                 {SendResult::kRejected, "Rejected"},
                                 {SendResult::kTimedOut, "TimedOut"},
                                 {SendResult::kUnknownDevice, "UnknownDevice"},
                                 {SendResult::kFileNotFound, "FileNotFound"},
                                 {SendResult::kAborted, "Aborted"},
                                 {SendResult::kFailed, "Failed"},
                             });

constexpr std::string_view ToString(SendResult result) {
    switch (result) {
    case SendResult::kSuccess:
        return "delivered";
    case SendResult::kQueued:
        return "queued";
    case SendResult::kRejected:
        return "rejected";
    case SendResult::kTimedOut:
        return "timed out";
    case SendResult::kUnknownDevice:
        return "unknown device";
    case SendResult::kFileNotFound:
        return "file not found";
    case SendResult::kAborted:
        return "aborted";
    case SendResult::kFailed:
        return "failed";
    }
    return "unknown";
}

} // namespace lanlink::core
