#pragma once

#include <boost/asio/ip/udp.hpp>
#include <string_view>

namespace lanlink::core {

using Endpoint = boost::asio::ip::udp::endpoint;

// Fire-and-forget datagram sending. Implementations must be callable from any thread.
class Transport {
public:
    virtual ~Transport() = default;

    // false when the datagram could not be handed to the network
    virtual bool SendTo(std::string_view payload, const Endpoint& target) = 0;
    virtual bool Broadcast(std::string_view payload) = 0;
};

} // namespace lanlink::core
