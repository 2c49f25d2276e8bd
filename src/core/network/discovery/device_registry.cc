#include <algorithm>
#include <core/network/discovery/device_registry.h>

namespace lanlink::core {

DeviceRegistry::DeviceRegistry(std::chrono::seconds device_timeout)
    : device_timeout_(device_timeout) {}

bool DeviceRegistry::Upsert(const std::string& name,
                            const std::string& ip_address,
                            std::uint16_t port,
                            Clock::time_point now) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const DeviceInfo& device) {
        return device.name == name;
    });
    if (it == devices_.end()) {
        devices_.push_back(DeviceInfo{name, ip_address, port, now});
        return true;
    }
    it->ip_address = ip_address;
    it->port = port;
    it->last_seen = std::max(it->last_seen, now);
    return false;
}

std::optional<DeviceInfo> DeviceRegistry::Lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for (const auto& device : devices_) {
        if (device.name == name) {
            return device;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DeviceRegistry::FindNameByAddress(const std::string& ip_address) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for (const auto& device : devices_) {
        if (device.ip_address == ip_address) {
            return device.name;
        }
    }
    return std::nullopt;
}

std::vector<DeviceInfo> DeviceRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return devices_;
}

std::vector<DeviceInfo> DeviceRegistry::Sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<DeviceInfo> expired;
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->last_seen > device_timeout_) {
            expired.push_back(std::move(*it));
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return devices_.size();
}

} // namespace lanlink::core
