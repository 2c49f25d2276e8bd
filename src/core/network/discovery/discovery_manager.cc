#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/discovery/discovery_manager.h>
#include <core/network/protocol/message_codec.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace lanlink::core {

DiscoveryManager::DiscoveryManager(io_context& ioc,
                                   Transport& transport,
                                   DeviceRegistry& registry,
                                   ReceiveManager& receive_manager,
                                   std::string local_name,
                                   DiscoveryOptions options,
                                   FeedbackCallback callback)
    : io_context_(ioc)
    , transport_(transport)
    , registry_(registry)
    , receive_manager_(receive_manager)
    , local_name_(std::move(local_name))
    , options_(options)
    , callback_(callback)
    , broadcast_timer_(ioc)
    , cleanup_timer_(ioc) {}

DiscoveryManager::~DiscoveryManager() {
    Stop();
}

void DiscoveryManager::Start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("start to discover devices, heartbeat every {}s",
                 options_.heartbeat_interval.count());
    co_spawn(io_context_, broadcaster(), detached);
    co_spawn(io_context_, cleanupDevices(), detached);
}

void DiscoveryManager::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // 定时器只能在 io_context 线程上取消
    post(io_context_, [this]() {
        broadcast_timer_.cancel();
        cleanup_timer_.cancel();
    });
    spdlog::info("stop to discover devices.");
}

void DiscoveryManager::Sweep(DeviceRegistry::Clock::time_point now) {
    for (const auto& device : registry_.Sweep(now)) {
        spdlog::info("Device lost: {} ({})", device.name, device.ip_address);
        feedback(FeedbackType::kLostDevice, feedback::LostDevice{.device_name = device.name});
    }
    receive_manager_.ExpireStale(now);
}

awaitable<void> DiscoveryManager::broadcaster() {
    const std::string data = MessageCodec::Encode(message::Heartbeat{local_name_});

    // 启动后立即广播一次，之后按间隔广播
    while (running_) {
        auto interval = std::chrono::duration_cast<steady_timer::duration>(
            options_.heartbeat_interval);
        if (transport_.Broadcast(data)) {
            spdlog::debug("Heartbeat sent: {}", data);
        } else {
            spdlog::warn("Heartbeat broadcast failed, retrying in 1s");
            interval = std::chrono::seconds(1);
        }

        broadcast_timer_.expires_after(interval);
        boost::system::error_code ec;
        co_await broadcast_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted) {
            break;
        }
    }
    spdlog::debug("Heartbeat loop stopped");
}

awaitable<void> DiscoveryManager::cleanupDevices() {
    while (running_) {
        cleanup_timer_.expires_after(options_.sweep_interval);
        boost::system::error_code ec;
        co_await cleanup_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted || !running_) {
            break;
        }

        try {
            Sweep();
        } catch (const std::exception& e) {
            spdlog::error("Error in cleanup_devices: {}", e.what());
        }
    }
    spdlog::debug("Sweeper loop stopped");
}

} // namespace lanlink::core
