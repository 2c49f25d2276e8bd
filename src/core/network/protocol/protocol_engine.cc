#include <core/constant/protocol.h>
#include <core/network/protocol/message_codec.h>
#include <core/network/protocol/protocol_engine.h>
#include <core/util/message_id.h>
#include <spdlog/spdlog.h>
#include <type_traits>

namespace fs = std::filesystem;

namespace lanlink::core {

namespace {

DuplicateFilter::Clock::duration DuplicateRetention(const ReliabilityOptions& options) {
    // Long enough to outlive every retransmission of the same TALK
    return 3 * options.max_retries * (options.ack_timeout + options.retry_backoff);
}

} // namespace

ProtocolEngine::ProtocolEngine(std::string local_name,
                               std::uint16_t port,
                               Transport& transport,
                               DeviceRegistry& registry,
                               DeliveryTracker& tracker,
                               ReceiveManager& receive_manager,
                               ReliabilityOptions options,
                               FeedbackCallback callback)
    : local_name_(std::move(local_name))
    , port_(port)
    , transport_(transport)
    , registry_(registry)
    , tracker_(tracker)
    , receive_manager_(receive_manager)
    , callback_(callback)
    , duplicate_filter_(DuplicateRetention(options))
    , reliable_sender_(transport, tracker, options)
    , send_session_manager_(reliable_sender_, local_name_, callback) {}

ProtocolEngine::~ProtocolEngine() {
    Shutdown();
}

void ProtocolEngine::HandleDatagram(std::string_view datagram,
                                    const Endpoint& from,
                                    Clock::time_point now) {
    auto message = MessageCodec::Decode(datagram);
    if (!message) {
        spdlog::warn("Dropped malformed datagram from {}:{} ({} bytes)",
                     from.address().to_string(),
                     from.port(),
                     datagram.size());
        return;
    }
    spdlog::debug("Received {} from {}:{}",
                  MessageCodec::TypeName(TypeOf(*message)),
                  from.address().to_string(),
                  from.port());
    Handle(*message, from, now);
}

void ProtocolEngine::Handle(const Message& message, const Endpoint& from, Clock::time_point now) {
    std::visit(
        [&](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, message::Heartbeat>) {
                onHeartbeat(msg, from, now);
            } else if constexpr (std::is_same_v<T, message::Talk>) {
                onTalk(msg, from, now);
            } else if constexpr (std::is_same_v<T, message::FileStart>) {
                onFileStart(msg, from, now);
            } else if constexpr (std::is_same_v<T, message::Chunk>) {
                onChunk(msg, from, now);
            } else if constexpr (std::is_same_v<T, message::End>) {
                onEnd(msg, from, now);
            } else if constexpr (std::is_same_v<T, message::Ack>) {
                onAck(msg);
            } else if constexpr (std::is_same_v<T, message::Nack>) {
                onNack(msg);
            }
        },
        message);
}

std::vector<DeviceInfo> ProtocolEngine::ListDevices() const {
    return registry_.Snapshot();
}

SendResult ProtocolEngine::SendMessage(const std::string& device_name, const std::string& text) {
    if (stopped_) {
        return SendResult::kAborted;
    }
    auto device = registry_.Lookup(device_name);
    if (!device) {
        spdlog::warn("Cannot send message: device {} not found", device_name);
        return SendResult::kUnknownDevice;
    }
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        spdlog::warn("Refusing to send an empty message to {}", device_name);
        return SendResult::kFailed;
    }

    auto message_id = GenerateMessageId(local_name_);
    auto payload = MessageCodec::Encode(message::Talk{message_id, text});
    auto result = reliable_sender_.Deliver(message_id, payload, deviceEndpoint(*device));
    if (result == SendResult::kSuccess) {
        spdlog::info("Message {} delivered to {}", message_id, device_name);
    } else {
        spdlog::error("Message {} to {} failed: {}", message_id, device_name, ToString(result));
    }
    return result;
}

SendResult ProtocolEngine::SendFile(const std::string& device_name, const fs::path& file_path) {
    if (stopped_) {
        return SendResult::kAborted;
    }
    auto device = registry_.Lookup(device_name);
    if (!device) {
        spdlog::warn("Cannot send file: device {} not found", device_name);
        return SendResult::kUnknownDevice;
    }
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        spdlog::warn("Cannot send file: {} not found", file_path.string());
        return SendResult::kFileNotFound;
    }

    auto file_id = send_session_manager_.SendFile(device_name, deviceEndpoint(*device), file_path);
    spdlog::info("Transfer {} of {} to {} queued", file_id, file_path.string(), device_name);
    return SendResult::kQueued;
}

void ProtocolEngine::Shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    tracker_.Cancel();
    send_session_manager_.WaitAll();
    spdlog::debug("Protocol engine stopped");
}

void ProtocolEngine::onHeartbeat(const message::Heartbeat& heartbeat,
                                 const Endpoint& from,
                                 Clock::time_point now) {
    if (heartbeat.device_name == local_name_) {
        return;
    }
    auto ip_address = from.address().to_string();
    if (registry_.Upsert(heartbeat.device_name, ip_address, from.port(), now)) {
        spdlog::info("Device found: {} ({})", heartbeat.device_name, ip_address);
        feedback(FeedbackType::kFoundDevice,
                 feedback::FoundDevice{
                     .device_name = heartbeat.device_name,
                     .ip_address = ip_address,
                     .port = from.port(),
                 });
    }
}

void ProtocolEngine::onTalk(const message::Talk& talk, const Endpoint& from, Clock::time_point now) {
    if (duplicate_filter_.Seen(talk.message_id)) {
        spdlog::debug("Duplicate message {}, acknowledging again", talk.message_id);
    } else {
        duplicate_filter_.Mark(talk.message_id, now);
        auto sender = resolveSender(from);
        spdlog::info("Message from {}: {}", sender, talk.text);
        feedback(FeedbackType::kMessageReceived,
                 feedback::MessageReceived{
                     .message_id = talk.message_id,
                     .sender = sender,
                     .text = talk.text,
                 });
    }
    reply(message::Ack{talk.message_id}, from);
}

void ProtocolEngine::onFileStart(const message::FileStart& file_start,
                                 const Endpoint& from,
                                 Clock::time_point now) {
    auto status = receive_manager_.BeginTransfer(file_start.file_id,
                                                 file_start.file_name,
                                                 file_start.file_size,
                                                 resolveSender(from),
                                                 now);
    if (status == FileStartStatus::kTooLarge) {
        reply(message::Nack{file_start.file_id, std::string(protocol::kReasonProcessingError)},
              from);
        return;
    }
    if (status != FileStartStatus::kStarted) {
        spdlog::debug("FILE {} already known, acknowledging again", file_start.file_id);
    }
    reply(message::Ack{file_start.file_id}, from);
}

void ProtocolEngine::onChunk(message::Chunk chunk, const Endpoint& from, Clock::time_point now) {
    auto ack_id = ChunkAckId(chunk.file_id, chunk.seq);
    switch (receive_manager_.AcceptChunk(chunk.file_id, chunk.seq, std::move(chunk.data), now)) {
    case ChunkStatus::kStored:
    case ChunkStatus::kDuplicate:
        reply(message::Ack{ack_id}, from);
        break;
    case ChunkStatus::kInvalid:
        reply(message::Nack{ack_id, std::string(protocol::kReasonSequenceInvalid)}, from);
        break;
    case ChunkStatus::kUnknownTransfer:
        spdlog::warn("Dropped chunk {} for unknown file {}", chunk.seq, chunk.file_id);
        break;
    }
}

void ProtocolEngine::onEnd(const message::End& end, const Endpoint& from, Clock::time_point now) {
    auto result = receive_manager_.Finish(end.file_id, end.file_checksum, now);
    switch (result.status) {
    case FinishStatus::kCompleted:
    case FinishStatus::kAlreadyCompleted:
        reply(message::Ack{end.file_id}, from);
        break;
    case FinishStatus::kHashMismatch:
        reply(message::Nack{end.file_id, std::string(protocol::kReasonHashInvalid)}, from);
        break;
    case FinishStatus::kWriteFailed:
        reply(message::Nack{end.file_id, std::string(protocol::kReasonProcessingError)}, from);
        break;
    case FinishStatus::kUnknownTransfer:
        spdlog::warn("Dropped END for unknown file {}", end.file_id);
        break;
    }
}

void ProtocolEngine::onAck(const message::Ack& ack) {
    tracker_.RecordPositive(ack.ack_id);
}

void ProtocolEngine::onNack(const message::Nack& nack) {
    spdlog::warn("NACK for {}: {}", nack.ack_id, nack.reason);
    tracker_.RecordNegative(nack.ack_id);
}

void ProtocolEngine::reply(const Message& message, const Endpoint& from) {
    Endpoint target(from.address(), port_);
    auto payload = MessageCodec::Encode(message);
    if (!transport_.SendTo(payload, target)) {
        spdlog::error("Failed to reply to {}: {}", target.address().to_string(), payload);
    }
}

std::string ProtocolEngine::resolveSender(const Endpoint& from) const {
    auto name = registry_.FindNameByAddress(from.address().to_string());
    return name ? *name : std::string(protocol::kUnknownDevice);
}

Endpoint ProtocolEngine::deviceEndpoint(const DeviceInfo& device) const {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(device.ip_address, ec);
    if (ec) {
        spdlog::error("Invalid address {} for {}: {}", device.ip_address, device.name, ec.message());
    }
    return Endpoint(address, port_);
}

} // namespace lanlink::core
