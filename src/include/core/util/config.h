/*
    config.h
    Application configuration stored as a TOML file under path::kConfigDir.

    Example usage:

    - Initialize the configuration (loads from file or creates default):
        lanlink::core::InitConfig();
    - Read a setting:
        std::uint16_t port = lanlink::core::settings.port;
        std::filesystem::path save_dir = lanlink::core::settings.save_dir;
    - Write a setting and persist it:
        lanlink::core::settings.device_name = "kitchen";
        lanlink::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace lanlink::core {

inline toml::table config;

struct Settings {
    std::string device_name;        // Name announced in heartbeats
    std::uint16_t port;             // UDP port for every protocol message
    std::filesystem::path save_dir; // Directory for received files
    std::chrono::seconds heartbeat_interval;
    std::chrono::seconds device_timeout;
    std::chrono::seconds sweep_interval;
    std::chrono::seconds transfer_timeout;
    std::chrono::milliseconds ack_timeout;
    std::chrono::milliseconds retry_backoff;
    int max_retries;
    std::string log_level;
};

inline Settings settings;

void InitConfig();

// Replaces the loaded configuration and refreshes settings from its [setting] table.
// Out-of-range values fall back to their defaults.
void ApplyConfig(toml::table table);

// Device names travel as a single token on the wire
std::string NormalizeDeviceName(std::string name);

void SaveConfig();

} // namespace lanlink::core
