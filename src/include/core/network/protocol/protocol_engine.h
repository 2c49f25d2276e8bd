#pragma once

#include <atomic>
#include <chrono>
#include <core/model/device_info.h>
#include <core/model/feedback.h>
#include <core/model/message.h>
#include <core/model/send_result.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/reliability/delivery_tracker.h>
#include <core/network/reliability/duplicate_filter.h>
#include <core/network/reliability/reliable_sender.h>
#include <core/network/transfer/receive_manager.h>
#include <core/network/transfer/send_session_manager.h>
#include <core/network/transport/transport.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lanlink::core {

// Inbound dispatch and the outbound reliable operations of one peer.
//
// HandleDatagram() must only be called from the listening loop: the duplicate filter it
// owns is not synchronized. SendMessage() and SendFile() may be called from any thread.
class ProtocolEngine {
public:
    using Clock = std::chrono::steady_clock;

    ProtocolEngine(std::string local_name,
                   std::uint16_t port,
                   Transport& transport,
                   DeviceRegistry& registry,
                   DeliveryTracker& tracker,
                   ReceiveManager& receive_manager,
                   ReliabilityOptions options = {},
                   FeedbackCallback callback = nullptr);
    ~ProtocolEngine();
    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    // Decodes and dispatches one inbound datagram. Malformed datagrams are logged and dropped.
    void HandleDatagram(std::string_view datagram,
                        const Endpoint& from,
                        Clock::time_point now = Clock::now());
    void Handle(const Message& message, const Endpoint& from, Clock::time_point now = Clock::now());

    std::vector<DeviceInfo> ListDevices() const;

    // Blocks until the peer acknowledges or the retry budget is exhausted
    SendResult SendMessage(const std::string& device_name, const std::string& text);

    // Returns kQueued once the transfer runs on its own thread; the final result arrives as
    // a kSendSessionEnded feedback event.
    SendResult SendFile(const std::string& device_name, const std::filesystem::path& file_path);

    // Wakes every waiting sender and joins the transfer threads
    void Shutdown();
    bool stopped() const { return stopped_; }

    const std::string& local_name() const { return local_name_; }
    std::uint16_t port() const { return port_; }

private:
    void onHeartbeat(const message::Heartbeat& heartbeat,
                     const Endpoint& from,
                     Clock::time_point now);
    void onTalk(const message::Talk& talk, const Endpoint& from, Clock::time_point now);
    void onFileStart(const message::FileStart& file_start,
                     const Endpoint& from,
                     Clock::time_point now);
    void onChunk(message::Chunk chunk, const Endpoint& from, Clock::time_point now);
    void onEnd(const message::End& end, const Endpoint& from, Clock::time_point now);
    void onAck(const message::Ack& ack);
    void onNack(const message::Nack& nack);

    // ACK/NACK go back to the source address at the protocol port
    void reply(const Message& message, const Endpoint& from);
    std::string resolveSender(const Endpoint& from) const;
    Endpoint deviceEndpoint(const DeviceInfo& device) const;

    void feedback(FeedbackType type, const nlohmann::json& data) const {
        if (callback_) {
            callback_(type, data);
        }
    }

    std::string local_name_;
    std::uint16_t port_;
    Transport& transport_;
    DeviceRegistry& registry_;
    DeliveryTracker& tracker_;
    ReceiveManager& receive_manager_;
    FeedbackCallback callback_;

    DuplicateFilter duplicate_filter_;
    ReliableSender reliable_sender_;
    SendSessionManager send_session_manager_;
    std::atomic<bool> stopped_ = false;
};

} // namespace lanlink::core
