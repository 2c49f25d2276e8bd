#include <cctype>
#include <charconv>
#include <iterator>
#include <core/network/protocol/message_codec.h>
#include <core/util/base64.h>
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace lanlink::core {

namespace {

bool IsSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string_view TrimLeft(std::string_view text) {
    while (!text.empty() && IsSpace(text.front())) {
        text.remove_prefix(1);
    }
    return text;
}

std::string_view Trim(std::string_view text) {
    text = TrimLeft(text);
    while (!text.empty() && IsSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

// Pops the next whitespace-delimited token off the front of `rest`
std::string_view NextToken(std::string_view& rest) {
    rest = TrimLeft(rest);
    std::size_t end = 0;
    while (end < rest.size() && !IsSpace(rest[end])) {
        ++end;
    }
    auto token = rest.substr(0, end);
    rest.remove_prefix(end);
    return token;
}

template<typename Integer>
std::optional<Integer> ParseNumber(std::string_view token) {
    Integer value{};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string MessageCodec::Encode(const Message& message) {
    return std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, message::Heartbeat>) {
                return fmt::format("HEARTBEAT {}", m.device_name);
            } else if constexpr (std::is_same_v<T, message::Talk>) {
                return fmt::format("TALK {} {}", m.message_id, m.text);
            } else if constexpr (std::is_same_v<T, message::FileStart>) {
                return fmt::format("FILE {} {} {}", m.file_id, m.file_name, m.file_size);
            } else if constexpr (std::is_same_v<T, message::Chunk>) {
                return fmt::format("CHUNK {} {} {}", m.file_id, m.seq, base64::Encode(m.data));
            } else if constexpr (std::is_same_v<T, message::End>) {
                return fmt::format("END {} {}", m.file_id, m.file_checksum);
            } else if constexpr (std::is_same_v<T, message::Ack>) {
                return fmt::format("ACK {}", m.ack_id);
            } else {
                return fmt::format("NACK {} {}", m.ack_id, m.reason);
            }
        },
        message);
}

std::optional<Message> MessageCodec::Decode(std::string_view datagram) {
    std::string_view rest = Trim(datagram);
    std::string_view type = NextToken(rest);

    if (type == "TALK") {
        auto message_id = NextToken(rest);
        auto text = TrimLeft(rest);
        if (message_id.empty() || text.empty()) {
            return std::nullopt;
        }
        return message::Talk{std::string(message_id), std::string(text)};
    }

    // Every other type has a fixed number of single-token fields
    std::string_view fields[3];
    std::size_t count = 0;
    while (true) {
        auto token = NextToken(rest);
        if (token.empty()) {
            break;
        }
        if (count == std::size(fields)) {
            return std::nullopt;
        }
        fields[count++] = token;
    }

    if (type == "HEARTBEAT" && count == 1) {
        return message::Heartbeat{std::string(fields[0])};
    }
    if (type == "FILE" && count == 3) {
        auto size = ParseNumber<std::uint64_t>(fields[2]);
        if (!size) {
            return std::nullopt;
        }
        return message::FileStart{std::string(fields[0]), std::string(fields[1]), *size};
    }
    if (type == "CHUNK" && count == 3) {
        auto seq = ParseNumber<std::size_t>(fields[1]);
        if (!seq) {
            return std::nullopt;
        }
        auto data = base64::Decode(fields[2]);
        if (!data) {
            return std::nullopt;
        }
        return message::Chunk{std::string(fields[0]), *seq, std::move(*data)};
    }
    if (type == "END" && count == 2) {
        return message::End{std::string(fields[0]), std::string(fields[1])};
    }
    if (type == "ACK" && count == 1) {
        return message::Ack{std::string(fields[0])};
    }
    if (type == "NACK" && count == 2) {
        return message::Nack{std::string(fields[0]), std::string(fields[1])};
    }
    return std::nullopt;
}

std::string_view MessageCodec::TypeName(MessageType type) {
    switch (type) {
    case MessageType::kHeartbeat:
        return "HEARTBEAT";
    case MessageType::kTalk:
        return "TALK";
    case MessageType::kFile:
        return "FILE";
    case MessageType::kChunk:
        return "CHUNK";
    case MessageType::kEnd:
        return "END";
    case MessageType::kAck:
        return "ACK";
    case MessageType::kNack:
        return "NACK";
    }
    return "UNKNOWN";
}

} // namespace lanlink::core
