#include "recording_transport.h"
#include "temp_dir.h"
#include <core/network/protocol/message_codec.h>
#include <core/network/protocol/protocol_engine.h>
#include <core/network/transfer/send_session.h>
#include <core/security/file_hasher.h>
#include <doctest/doctest.h>
#include <set>

using namespace lanlink;
using namespace lanlink::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

const Endpoint kAlice = test::MakeEndpoint("10.0.0.1", 5000);
const Endpoint kBob = test::MakeEndpoint("10.0.0.2", 5000);

ReliabilityOptions FastOptions() {
    ReliabilityOptions options;
    options.ack_timeout = 50ms;
    options.retry_backoff = 5ms;
    options.max_retries = 3;
    return options;
}

// alice sends, bob receives. Every datagram is delivered synchronously to the other
// side's engine, so a whole transfer runs on the calling thread.
struct LoopbackFixture {
    test::TempDir outbox;
    test::TempDir inbox;

    test::RecordingTransport alice_transport;
    DeviceRegistry alice_registry;
    DeliveryTracker alice_tracker;
    ReceiveManager alice_receiver{outbox.path() / "alice_downloads"};
    ProtocolEngine alice{"alice",
                         5000,
                         alice_transport,
                         alice_registry,
                         alice_tracker,
                         alice_receiver,
                         FastOptions()};
    ReliableSender alice_sender{alice_transport, alice_tracker, FastOptions()};

    test::RecordingTransport bob_transport;
    DeviceRegistry bob_registry;
    DeliveryTracker bob_tracker;
    ReceiveManager bob_receiver{inbox.path()};
    ProtocolEngine bob{"bob", 5000, bob_transport, bob_registry, bob_tracker, bob_receiver};

    std::vector<std::pair<FeedbackType, nlohmann::json>> events;
    SessionStatus last_status = SessionStatus::kIdle;

    LoopbackFixture() {
        alice_transport.SetHook([this](const std::string& payload, const Endpoint&) {
            bob.HandleDatagram(payload, kAlice);
        });
        bob_transport.SetHook([this](const std::string& payload, const Endpoint&) {
            alice.HandleDatagram(payload, kBob);
        });
    }

    fs::path MakeFile(const std::string& name, const BinaryData& content) {
        auto path = outbox.path() / name;
        test::WriteAll(path, content);
        return path;
    }

    SendResult Send(const fs::path& path) {
        SendSession session(alice_sender,
                            "alice",
                            "bob",
                            kBob,
                            path,
                            [this](FeedbackType type, const nlohmann::json& data) {
                                events.emplace_back(type, data);
                            });
        auto result = session.Run();
        last_status = session.session_status();
        return result;
    }
};

} // namespace

TEST_CASE_FIXTURE(LoopbackFixture, "a 1000-byte file travels as four acknowledged chunks") {
    auto content = test::PatternBytes(1000);
    auto path = MakeFile("thousand.bin", content);

    CHECK(Send(path) == SendResult::kSuccess);
    CHECK(last_status == SessionStatus::kCompleted);

    auto sent = alice_transport.payloads();
    REQUIRE(sent.size() == 6);
    CHECK(sent[0].rfind("FILE alice-", 0) == 0);
    CHECK(sent[0].substr(sent[0].size() - 17) == "thousand.bin 1000");
    for (std::size_t seq = 0; seq < 4; ++seq) {
        auto chunk = MessageCodec::Decode(sent[1 + seq]);
        REQUIRE(chunk.has_value());
        const auto& c = std::get<message::Chunk>(*chunk);
        CHECK(c.seq == seq);
        CHECK(c.data.size() == 250);
    }
    auto end = MessageCodec::Decode(sent[5]);
    REQUIRE(end.has_value());
    CHECK(std::get<message::End>(*end).file_checksum == FileHasher::CalculateDataChecksum(content));

    auto acks = bob_transport.payloads();
    REQUIRE(acks.size() == 6);
    for (const auto& ack : acks) {
        CHECK(ack.rfind("ACK ", 0) == 0);
    }

    CHECK(test::ReadAll(inbox.path() / "thousand.bin") == content);

    REQUIRE_FALSE(events.empty());
    CHECK(events.back().first == FeedbackType::kSendSessionEnded);
    auto ended = events.back().second.get<feedback::SendSessionEnd>();
    CHECK(ended.result == SendResult::kSuccess);
    CHECK(ended.device_name == "bob");
    CHECK(ended.filename == "thousand.bin");
}

TEST_CASE_FIXTURE(LoopbackFixture, "whitespace in the file name is replaced") {
    BinaryData content{'h', 'e', 'y'};
    auto path = MakeFile("my notes.txt", content);

    CHECK(Send(path) == SendResult::kSuccess);
    CHECK(test::ReadAll(inbox.path() / "my_notes.txt") == content);
}

TEST_CASE_FIXTURE(LoopbackFixture, "an empty file needs no chunks") {
    auto path = MakeFile("empty.txt", {});
    CHECK(Send(path) == SendResult::kSuccess);
    CHECK(alice_transport.CountPrefix("CHUNK ") == 0);
    CHECK(fs::exists(inbox.path() / "empty.txt"));
}

TEST_CASE_FIXTURE(LoopbackFixture, "lost datagrams are retransmitted") {
    auto content = test::PatternBytes(700);
    auto path = MakeFile("lossy.bin", content);

    // Drop the first copy of every chunk on its way to bob
    std::set<std::string> delivered;
    alice_transport.SetHook([this, &delivered](const std::string& payload, const Endpoint&) {
        if (payload.rfind("CHUNK ", 0) == 0 && delivered.insert(payload).second) {
            return;
        }
        bob.HandleDatagram(payload, kAlice);
    });

    CHECK(Send(path) == SendResult::kSuccess);
    CHECK(alice_transport.CountPrefix("CHUNK ") == 6);
    CHECK(test::ReadAll(inbox.path() / "lossy.bin") == content);
}

TEST_CASE_FIXTURE(LoopbackFixture, "lost acknowledgments do not duplicate data") {
    auto content = test::PatternBytes(520);
    auto path = MakeFile("dup.bin", content);

    // Drop the first copy of every ACK on its way back to alice
    std::set<std::string> seen_acks;
    bob_transport.SetHook([this, &seen_acks](const std::string& payload, const Endpoint&) {
        if (payload.rfind("ACK ", 0) == 0 && seen_acks.insert(payload).second) {
            return;
        }
        alice.HandleDatagram(payload, kBob);
    });

    CHECK(Send(path) == SendResult::kSuccess);
    CHECK(test::ReadAll(inbox.path() / "dup.bin") == content);
}

TEST_CASE_FIXTURE(LoopbackFixture, "a silent receiver times the transfer out at FILE") {
    alice_transport.SetHook(nullptr);
    auto path = MakeFile("void.bin", test::PatternBytes(10));

    CHECK(Send(path) == SendResult::kTimedOut);
    CHECK(last_status == SessionStatus::kFailed);
    CHECK(alice_transport.CountPrefix("FILE ") == 3);
    CHECK(alice_transport.CountPrefix("CHUNK ") == 0);

    auto ended = events.back().second.get<feedback::SendSessionEnd>();
    CHECK(ended.result == SendResult::kTimedOut);
}

TEST_CASE_FIXTURE(LoopbackFixture, "a corrupted chunk fails the transfer at END") {
    auto content = test::PatternBytes(400);
    auto path = MakeFile("corrupt.bin", content);

    alice_transport.SetHook([this](const std::string& payload, const Endpoint&) {
        auto message = MessageCodec::Decode(payload);
        if (message && std::holds_alternative<message::Chunk>(*message)) {
            auto chunk = std::get<message::Chunk>(*message);
            chunk.data[0] ^= 0xFF;
            bob.Handle(chunk, kAlice);
            return;
        }
        bob.HandleDatagram(payload, kAlice);
    });

    CHECK(Send(path) == SendResult::kRejected);
    CHECK(last_status == SessionStatus::kFailed);
    CHECK(alice_transport.CountPrefix("END ") == 1);
    CHECK(bob_transport.payloads().back().rfind("NACK ", 0) == 0);
    CHECK_FALSE(fs::exists(inbox.path() / "corrupt.bin"));
}

TEST_CASE_FIXTURE(LoopbackFixture, "a missing file fails without traffic") {
    CHECK(Send(outbox.path() / "gone.bin") == SendResult::kFailed);
    CHECK(last_status == SessionStatus::kFailed);
    CHECK(alice_transport.sent().empty());
}
