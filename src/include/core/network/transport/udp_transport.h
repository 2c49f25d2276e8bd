#pragma once

#include <boost/asio.hpp>
#include <core/network/transport/transport.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace lanlink::core {

struct Datagram {
    std::string data;
    Endpoint sender;
};

class UdpTransport : public Transport {
public:
    UdpTransport(boost::asio::io_context& ioc, std::uint16_t port);
    ~UdpTransport() override;
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    // Binds the listening socket to 0.0.0.0:port and opens the broadcast-capable sending
    // socket. Throws boost::system::system_error.
    void Open();
    void Close();
    bool IsOpen() const { return listen_socket_.is_open(); }

    std::uint16_t port() const { return port_; }

    bool SendTo(std::string_view payload, const Endpoint& target) override;
    bool Broadcast(std::string_view payload) override;

    // Must be awaited from the io_context the transport was created with.
    // Throws boost::system::system_error, operation_aborted once closed.
    boost::asio::awaitable<Datagram> Receive();

private:
    std::uint16_t port_;
    Endpoint broadcast_endpoint_;

    boost::asio::ip::udp::socket listen_socket_;
    std::mutex send_mutex_;
    boost::asio::ip::udp::socket send_socket_;
};

} // namespace lanlink::core
