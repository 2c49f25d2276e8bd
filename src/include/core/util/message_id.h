#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lanlink::core {

// "<device_name>-<epoch_seconds>-<4 random digits>"
std::string GenerateMessageId(std::string_view device_name);

// Acknowledgment id of a single chunk: "<file_id>-<seq>"
std::string ChunkAckId(std::string_view file_id, std::size_t seq);

} // namespace lanlink::core
