#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct FileReceivingCompleted {
    std::string file_id;
    std::string filename;
    std::string sender;
    std::string saved_path;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FileReceivingCompleted, file_id, filename, sender, saved_path);
};

} // namespace lanlink::core::feedback
