#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct MessageReceived {
    std::string message_id;
    std::string sender;
    std::string text;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(MessageReceived, message_id, sender, text);
};

} // namespace lanlink::core::feedback
