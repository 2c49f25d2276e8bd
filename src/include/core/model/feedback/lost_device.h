#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct LostDevice {
    std::string device_name;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LostDevice, device_name);
};

} // namespace lanlink::core::feedback
