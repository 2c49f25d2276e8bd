#pragma once

#include <chrono>
#include <core/util/binary_data.h>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace lanlink::core {

struct ReceiveFileContext {
    std::string file_name;                    // 文件名（只保留最后一级路径）
    std::uint64_t file_size;                  // 声明的总大小
    std::size_t total_chunks;                 // 总块数 ceil(file_size / kChunkSize)
    std::size_t received_count;               // 已接收块数
    std::string sender;                       // 发送方设备名
    std::map<std::size_t, BinaryData> chunks; // 序号 -> 原始数据，按序号升序
    std::chrono::steady_clock::time_point last_activity; // 最后一次 FILE/CHUNK 的时间
};

} // namespace lanlink::core
