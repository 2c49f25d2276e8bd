#pragma once

#include <core/model/send_result.h>
#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct SendSessionEnd {
    std::string file_id;
    std::string device_name;
    std::string filename;
    SendResult result = SendResult::kSuccess;
    std::string error_message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        SendSessionEnd, file_id, device_name, filename, result, error_message);
};

} // namespace lanlink::core::feedback
