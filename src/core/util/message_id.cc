#include <chrono>
#include <core/util/message_id.h>
#include <random>
#include <spdlog/fmt/fmt.h>

namespace lanlink::core {

std::string GenerateMessageId(std::string_view device_name) {
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch())
                         .count();

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(1000, 9999);

    return fmt::format("{}-{}-{}", device_name, timestamp, dis(gen));
}

std::string ChunkAckId(std::string_view file_id, std::size_t seq) {
    return fmt::format("{}-{}", file_id, seq);
}

} // namespace lanlink::core
