#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lanlink::core::feedback {

struct FoundDevice {
    std::string device_name;
    std::string ip_address;
    std::uint16_t port;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FoundDevice, device_name, ip_address, port);
};

} // namespace lanlink::core::feedback
