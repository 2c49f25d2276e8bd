#pragma once

#include <core/util/binary_data.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace lanlink::core {

enum class MessageType {
    kHeartbeat,
    kTalk,
    kFile,
    kChunk,
    kEnd,
    kAck,
    kNack,
};

namespace message {

// HEARTBEAT <name>
struct Heartbeat {
    std::string device_name;
};

// TALK <msg_id> <text...>
struct Talk {
    std::string message_id;
    std::string text;
};

// FILE <file_id> <filename> <size_bytes>
struct FileStart {
    std::string file_id;
    std::string file_name;
    std::uint64_t file_size;
};

// CHUNK <file_id> <seq> <base64_payload>
struct Chunk {
    std::string file_id;
    std::size_t seq;
    BinaryData data; // decoded payload
};

// END <file_id> <hex_sha256>
struct End {
    std::string file_id;
    std::string file_checksum;
};

// ACK <id>
struct Ack {
    std::string ack_id;
};

// NACK <id> <reason>
struct Nack {
    std::string ack_id;
    std::string reason;
};

} // namespace message

using Message = std::variant<message::Heartbeat,
                             message::Talk,
                             message::FileStart,
                             message::Chunk,
                             message::End,
                             message::Ack,
                             message::Nack>;

inline MessageType TypeOf(const Message& message) {
    return static_cast<MessageType>(message.index());
}

} // namespace lanlink::core
