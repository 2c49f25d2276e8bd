#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <core/constant/protocol.h>
#include <core/model/feedback.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/transfer/receive_manager.h>
#include <core/network/transport/transport.h>
#include <string>

namespace lanlink::core {

struct DiscoveryOptions {
    std::chrono::seconds heartbeat_interval = protocol::kHeartbeatInterval;
    std::chrono::seconds sweep_interval = protocol::kSweepInterval;
};

// Heartbeat broadcaster and registry sweeper, both coroutines on the node's io_context
class DiscoveryManager {
public:
    DiscoveryManager(boost::asio::io_context& ioc,
                     Transport& transport,
                     DeviceRegistry& registry,
                     ReceiveManager& receive_manager,
                     std::string local_name,
                     DiscoveryOptions options = {},
                     FeedbackCallback callback = nullptr);
    ~DiscoveryManager();

    void Start();
    void Stop();

    // One sweep pass: evicts silent devices and expired receive transfers
    void Sweep(DeviceRegistry::Clock::time_point now = DeviceRegistry::Clock::now());

private:
    // 协程任务
    boost::asio::awaitable<void> broadcaster();
    boost::asio::awaitable<void> cleanupDevices();

    void feedback(FeedbackType type, const nlohmann::json& data) const {
        if (callback_) {
            callback_(type, data);
        }
    }

    boost::asio::io_context& io_context_;
    Transport& transport_;
    DeviceRegistry& registry_;
    ReceiveManager& receive_manager_;
    std::string local_name_;
    DiscoveryOptions options_;
    FeedbackCallback callback_;

    boost::asio::steady_timer broadcast_timer_;
    boost::asio::steady_timer cleanup_timer_;
    std::atomic<bool> running_ = false;
};

} // namespace lanlink::core
