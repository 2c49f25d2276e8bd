#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lanlink::core {

struct DeviceInfo {
    std::string name;       // Announced in HEARTBEAT, unique per segment by convention
    std::string ip_address;
    std::uint16_t port;     // Source port of the last heartbeat
    std::chrono::steady_clock::time_point last_seen;
};

} // namespace lanlink::core
