#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct ReceiveSessionEnd {
    std::string file_id;
    std::string filename;
    bool success = false;
    std::string error_message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ReceiveSessionEnd, file_id, filename, success, error_message);
};

} // namespace lanlink::core::feedback
