#pragma once

#include <core/model/message.h>
#include <optional>
#include <string>
#include <string_view>

namespace lanlink::core {

// Line-oriented text framing, one message per datagram:
//
//   HEARTBEAT <name>
//   TALK <msg_id> <text...>
//   FILE <file_id> <filename> <size_bytes>
//   CHUNK <file_id> <seq> <base64_payload>
//   END <file_id> <hex_sha256>
//   ACK <id>
//   NACK <id> <reason>
//
// Fields are separated by runs of whitespace. Only the TALK text may contain spaces.
class MessageCodec {
public:
    static std::string Encode(const Message& message);

    // std::nullopt for unknown types, wrong field counts, non-numeric size/sequence
    // and invalid base64.
    static std::optional<Message> Decode(std::string_view datagram);

    static std::string_view TypeName(MessageType type);
};

} // namespace lanlink::core
