#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/peer_node.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace lanlink::core {

NodeOptions NodeOptions::FromSettings(const Settings& settings) {
    NodeOptions options;
    options.device_name = settings.device_name;
    options.port = settings.port;
    options.save_dir = settings.save_dir;
    options.device_timeout = settings.device_timeout;
    options.transfer_timeout = settings.transfer_timeout;
    options.discovery.heartbeat_interval = settings.heartbeat_interval;
    options.discovery.sweep_interval = settings.sweep_interval;
    options.reliability.ack_timeout = settings.ack_timeout;
    options.reliability.retry_backoff = settings.retry_backoff;
    options.reliability.max_retries = settings.max_retries;
    return options;
}

PeerNode::PeerNode(NodeOptions options, FeedbackCallback callback)
    : options_(std::move(options))
    , transport_(ioc_, options_.port)
    , registry_(options_.device_timeout)
    , receive_manager_(options_.save_dir, options_.transfer_timeout, callback)
    , engine_(options_.device_name,
              options_.port,
              transport_,
              registry_,
              tracker_,
              receive_manager_,
              options_.reliability,
              callback)
    , discovery_manager_(ioc_,
                         transport_,
                         registry_,
                         receive_manager_,
                         options_.device_name,
                         options_.discovery,
                         callback) {}

PeerNode::~PeerNode() {
    Shutdown();
}

void PeerNode::Start() {
    if (running_) {
        return;
    }
    transport_.Open();
    running_ = true;

    net::co_spawn(ioc_, listener(), net::detached);
    discovery_manager_.Start();

    io_thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            spdlog::error("io_context stopped unexpectedly: {}", e.what());
        }
    });

    spdlog::info("{} listening on UDP port {}, saving files to {}",
                 options_.device_name,
                 options_.port,
                 receive_manager_.save_dir().string());
}

void PeerNode::Shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("Shutting down {}", options_.device_name);

    // Outbound transfers see the cancelled tracker and stop at their current attempt
    engine_.Shutdown();
    discovery_manager_.Stop();

    ioc_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    transport_.Close();
}

std::vector<DeviceInfo> PeerNode::ListDevices() const {
    return engine_.ListDevices();
}

SendResult PeerNode::SendMessage(const std::string& device_name, const std::string& text) {
    return engine_.SendMessage(device_name, text);
}

SendResult PeerNode::SendFile(const std::string& device_name,
                              const std::filesystem::path& file_path) {
    return engine_.SendFile(device_name, file_path);
}

net::awaitable<void> PeerNode::listener() {
    net::steady_timer pause_timer(co_await net::this_coro::executor);

    while (running_) {
        bool transport_failed = false;
        try {
            auto datagram = co_await transport_.Receive();
            engine_.HandleDatagram(datagram.data, datagram.sender);
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted || !running_) {
                break;
            }
            spdlog::error("Error in listener: {}", e.what());
            transport_failed = true;
        } catch (const std::exception& e) {
            spdlog::error("Error handling datagram: {}", e.what());
        }

        if (transport_failed) {
            pause_timer.expires_after(std::chrono::seconds(1));
            boost::system::error_code ec;
            co_await pause_timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
    }
    spdlog::debug("Listener loop stopped");
}

} // namespace lanlink::core
