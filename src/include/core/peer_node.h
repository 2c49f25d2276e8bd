#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <core/model/device_info.h>
#include <core/model/feedback.h>
#include <core/model/send_result.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/network/protocol/protocol_engine.h>
#include <core/network/reliability/delivery_tracker.h>
#include <core/network/reliability/reliable_sender.h>
#include <core/network/transfer/receive_manager.h>
#include <core/network/transport/udp_transport.h>
#include <core/util/config.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace lanlink::core {

struct NodeOptions {
    std::string device_name;
    std::uint16_t port = protocol::kDefaultPort;
    std::filesystem::path save_dir = path::kSystemDownloadDir;
    std::chrono::seconds device_timeout = protocol::kDeviceTimeout;
    std::chrono::seconds transfer_timeout = protocol::kTransferTimeout;
    DiscoveryOptions discovery;
    ReliabilityOptions reliability;

    static NodeOptions FromSettings(const Settings& settings);
};

// One running peer: the UDP sockets, the listening, heartbeat and sweeper loops on a
// background io_context thread, and the operations offered to the command surface.
class PeerNode {
public:
    explicit PeerNode(NodeOptions options, FeedbackCallback callback = nullptr);
    ~PeerNode();
    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    // Throws boost::system::system_error when the port cannot be bound
    void Start();
    void Shutdown();
    bool running() const { return running_; }

    std::vector<DeviceInfo> ListDevices() const;
    SendResult SendMessage(const std::string& device_name, const std::string& text);
    SendResult SendFile(const std::string& device_name, const std::filesystem::path& file_path);

    const NodeOptions& options() const { return options_; }

private:
    boost::asio::awaitable<void> listener();

    NodeOptions options_;

    boost::asio::io_context ioc_;
    UdpTransport transport_;
    DeviceRegistry registry_;
    DeliveryTracker tracker_;
    ReceiveManager receive_manager_;
    ProtocolEngine engine_;
    DiscoveryManager discovery_manager_;

    std::thread io_thread_;
    std::atomic<bool> running_ = false;
};

} // namespace lanlink::core
