#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace lanlink::core {

namespace protocol {

constexpr std::uint16_t kDefaultPort = 5000;
constexpr std::string_view kBroadcastAddress = "255.255.255.255";

constexpr auto kHeartbeatInterval = std::chrono::seconds(25);
constexpr auto kDeviceTimeout = std::chrono::seconds(120);
constexpr auto kSweepInterval = std::chrono::seconds(1);
constexpr auto kTransferTimeout = std::chrono::seconds(120);

constexpr auto kAckTimeout = std::chrono::milliseconds(2000);
constexpr auto kRetryBackoff = std::chrono::milliseconds(1000);
constexpr int kMaxRetries = 10;

constexpr std::size_t kChunkSize = 250;      // raw bytes per CHUNK, before base64
constexpr std::size_t kReceiveBufferSize = 8192;
// Received files are reassembled in memory, so a declared size must fit in one buffer
constexpr std::uint64_t kMaxFileSize =
    static_cast<std::uint64_t>(std::numeric_limits<std::ptrdiff_t>::max());

// NACK reason tokens
constexpr std::string_view kReasonHashInvalid = "hash_invalido";
constexpr std::string_view kReasonProcessingError = "erro_processamento";
constexpr std::string_view kReasonSequenceInvalid = "seq_invalido";

constexpr std::string_view kUnknownDevice = "unknown device";

constexpr std::size_t TotalChunks(std::uint64_t file_size, std::size_t chunk_size = kChunkSize) {
    return static_cast<std::size_t>(file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0));
}

} // namespace protocol

} // namespace lanlink::core
