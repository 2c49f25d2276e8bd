#pragma once

#include <chrono>
#include <core/constant/protocol.h>
#include <core/model/device_info.h>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanlink::core {

// Peers currently considered reachable, keyed by announced name. Safe to use from
// any thread.
class DeviceRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit DeviceRegistry(std::chrono::seconds device_timeout = protocol::kDeviceTimeout);

    // Creates or refreshes a record (last writer wins on address). Returns true when the
    // name was not known before.
    bool Upsert(const std::string& name,
                const std::string& ip_address,
                std::uint16_t port,
                Clock::time_point now = Clock::now());

    std::optional<DeviceInfo> Lookup(const std::string& name) const;

    // Reverse lookup by source address; first match in insertion order
    std::optional<std::string> FindNameByAddress(const std::string& ip_address) const;

    // Insertion-ordered copy
    std::vector<DeviceInfo> Snapshot() const;

    // Removes every device with now - last_seen > device_timeout, returning them
    std::vector<DeviceInfo> Sweep(Clock::time_point now = Clock::now());

    std::size_t size() const;
    std::chrono::seconds device_timeout() const { return device_timeout_; }

private:
    mutable std::mutex devices_mutex_;
    std::chrono::seconds device_timeout_;
    std::vector<DeviceInfo> devices_;
};

} // namespace lanlink::core
