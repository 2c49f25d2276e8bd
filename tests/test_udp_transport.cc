#include "recording_transport.h"
#include "temp_dir.h"
#include "udp_socket.h"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <core/network/protocol/message_codec.h>
#include <core/network/transport/udp_transport.h>
#include <doctest/doctest.h>

using namespace lanlink;
using namespace lanlink::core;
using namespace std::chrono_literals;
namespace net = boost::asio;

TEST_CASE("a full-size CHUNK survives a trip through the UDP sockets") {
    net::io_context ioc;
    UdpTransport receiver(ioc, test::FreeUdpPort());
    UdpTransport sender(ioc, test::FreeUdpPort());
    receiver.Open();
    sender.Open();
    REQUIRE(receiver.IsOpen());

    auto data = test::PatternBytes(protocol::kChunkSize);
    auto payload = MessageCodec::Encode(message::Chunk{"alice-1700000000-4321", 7, data});
    REQUIRE(payload.size() > 300);

    auto received = net::co_spawn(ioc, receiver.Receive(), net::use_future);
    REQUIRE(sender.SendTo(payload, test::MakeEndpoint("127.0.0.1", receiver.port())));
    ioc.run_for(2s);

    REQUIRE(received.wait_for(0s) == std::future_status::ready);
    auto datagram = received.get();
    CHECK(datagram.data == payload);
    CHECK(datagram.sender.address().to_string() == "127.0.0.1");

    auto message = MessageCodec::Decode(datagram.data);
    REQUIRE(message.has_value());
    const auto& chunk = std::get<message::Chunk>(*message);
    CHECK(chunk.seq == 7);
    CHECK(chunk.data == data);
}

TEST_CASE("closing the transport aborts a pending receive") {
    net::io_context ioc;
    UdpTransport transport(ioc, test::FreeUdpPort());
    transport.Open();

    auto received = net::co_spawn(ioc, transport.Receive(), net::use_future);
    net::post(ioc, [&transport]() { transport.Close(); });
    ioc.run_for(2s);

    REQUIRE(received.wait_for(0s) == std::future_status::ready);
    bool aborted = false;
    try {
        received.get();
    } catch (const boost::system::system_error& e) {
        aborted = e.code() == net::error::operation_aborted;
    }
    CHECK(aborted);
    CHECK_FALSE(transport.IsOpen());
    CHECK_FALSE(transport.SendTo("ACK x", test::MakeEndpoint("127.0.0.1", 9)));
}

TEST_CASE("two transports can share a port through address reuse") {
    net::io_context ioc;
    auto port = test::FreeUdpPort();
    UdpTransport first(ioc, port);
    first.Open();

    UdpTransport second(ioc, port);
    CHECK_NOTHROW(second.Open());
    CHECK(second.IsOpen());
}
