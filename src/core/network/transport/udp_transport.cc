#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <array>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/protocol.h>
#include <core/network/transport/udp_transport.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace lanlink::core {

UdpTransport::UdpTransport(io_context& ioc, std::uint16_t port)
    : port_(port)
    , broadcast_endpoint_(ip::make_address_v4(std::string(protocol::kBroadcastAddress)), port)
    , listen_socket_(ioc)
    , send_socket_(ioc) {}

UdpTransport::~UdpTransport() {
    Close();
}

void UdpTransport::Open() {
    ip::udp::endpoint listen_endpoint(ip::udp::v4(), port_);
    listen_socket_.open(listen_endpoint.protocol());
    listen_socket_.set_option(socket_base::reuse_address(true));
    listen_socket_.bind(listen_endpoint);

    std::lock_guard<std::mutex> lock(send_mutex_);
    send_socket_.open(ip::udp::v4());
    send_socket_.set_option(socket_base::broadcast(true));

    spdlog::info("Listening on UDP port {}", port_);
}

void UdpTransport::Close() {
    boost::system::error_code ec;
    if (listen_socket_.is_open()) {
        listen_socket_.close(ec);
        spdlog::debug("listen socket is closed");
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (send_socket_.is_open()) {
        send_socket_.close(ec);
        spdlog::debug("send socket is closed");
    }
}

bool UdpTransport::SendTo(std::string_view payload, const Endpoint& target) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!send_socket_.is_open()) {
        spdlog::warn("Transport is closed, dropping datagram to {}:{}",
                     target.address().to_string(),
                     target.port());
        return false;
    }
    boost::system::error_code ec;
    std::size_t bytes_sent = send_socket_.send_to(buffer(payload.data(), payload.size()),
                                                  target,
                                                  0,
                                                  ec);
    if (ec) {
        spdlog::error("Failed to send datagram to {}:{}: {}",
                      target.address().to_string(),
                      target.port(),
                      ec.message());
        return false;
    }
    return bytes_sent > 0;
}

bool UdpTransport::Broadcast(std::string_view payload) {
    return SendTo(payload, broadcast_endpoint_);
}

awaitable<Datagram> UdpTransport::Receive() {
    std::array<char, protocol::kReceiveBufferSize> recv_buffer;
    Datagram datagram;
    std::size_t bytes_received = co_await listen_socket_.async_receive_from(buffer(recv_buffer),
                                                                            datagram.sender,
                                                                            use_awaitable);
    datagram.data.assign(recv_buffer.data(), bytes_received);
    co_return datagram;
}

} // namespace lanlink::core
