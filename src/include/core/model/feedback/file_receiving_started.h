#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct FileReceivingStarted {
    std::string file_id;
    std::string filename;
    std::uint64_t file_size;
    std::string sender;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FileReceivingStarted, file_id, filename, file_size, sender);
};

} // namespace lanlink::core::feedback
