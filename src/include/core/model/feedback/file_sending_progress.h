#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct FileSendingProgress {
    std::string file_id;
    std::string filename;
    double progress;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FileSendingProgress, file_id, filename, progress);
};

} // namespace lanlink::core::feedback
