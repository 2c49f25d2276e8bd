#include <algorithm>
#include <cctype>
#include <core/constant/path.h>
#include <core/constant/protocol.h>
#include <core/util/config.h>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <string_view>

namespace lanlink::core {

namespace {

template <typename Duration>
Duration LoadDuration(toml::table& setting,
                      std::string_view key,
                      Duration fallback,
                      std::int64_t minimum = 1) {
    auto value = setting[key].value_or(static_cast<std::int64_t>(fallback.count()));
    if (value < minimum) {
        spdlog::warn("{} must be at least {}, got {}; using {}",
                     key,
                     minimum,
                     value,
                     fallback.count());
        return fallback;
    }
    return Duration(value);
}

void LoadSetting() {
    if (!config.contains("setting")) {
        config.insert("setting", toml::table{});
    }
    auto& setting = config["setting"].ref<toml::table>();

    settings.device_name = NormalizeDeviceName(setting["device-name"].value_or(std::string{}));

    auto port = setting["port"].value_or(static_cast<std::int64_t>(protocol::kDefaultPort));
    if (port < 1 || port > std::numeric_limits<std::uint16_t>::max()) {
        spdlog::warn("port must be between 1 and 65535, got {}; using {}",
                     port,
                     protocol::kDefaultPort);
        port = protocol::kDefaultPort;
    }
    settings.port = static_cast<std::uint16_t>(port);

    settings.save_dir = setting["save-dir"].value_or(path::kSystemDownloadDir.string());
    settings.heartbeat_interval =
        LoadDuration(setting, "heartbeat-interval", protocol::kHeartbeatInterval);
    settings.device_timeout = LoadDuration(setting, "device-timeout", protocol::kDeviceTimeout);
    settings.sweep_interval = LoadDuration(setting, "sweep-interval", protocol::kSweepInterval);
    settings.transfer_timeout =
        LoadDuration(setting, "transfer-timeout", protocol::kTransferTimeout);
    settings.ack_timeout = LoadDuration(setting, "ack-timeout-ms", protocol::kAckTimeout);
    settings.retry_backoff =
        LoadDuration(setting, "retry-backoff-ms", protocol::kRetryBackoff, 0);
    settings.max_retries = static_cast<int>(
        setting["max-retries"].value_or(static_cast<std::int64_t>(protocol::kMaxRetries)));
    settings.log_level = setting["log-level"].value_or(std::string{"info"});

    if (settings.max_retries < 1) {
        spdlog::warn("max-retries must be at least 1, got {}; using 1", settings.max_retries);
        settings.max_retries = 1;
    }
}

} // namespace

std::string NormalizeDeviceName(std::string name) {
    std::replace_if(
        name.begin(),
        name.end(),
        [](unsigned char c) { return std::isspace(c); },
        '_');
    return name;
}

void ApplyConfig(toml::table table) {
    config = std::move(table);
    LoadSetting();
}

void InitConfig() {
    if (!std::filesystem::exists(path::kConfigDir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(path::kConfigDir);
    }
    auto path = path::kConfigDir / "config.toml";
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    toml::table table;
    try {
        table = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
    }

    ApplyConfig(std::move(table));
}

void SaveConfig() {
    auto path = path::kConfigDir / "config.toml";
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"device-name", settings.device_name},
                                {"port", static_cast<std::int64_t>(settings.port)},
                                {"save-dir", settings.save_dir.string()},
                                {"heartbeat-interval", settings.heartbeat_interval.count()},
                                {"device-timeout", settings.device_timeout.count()},
                                {"sweep-interval", settings.sweep_interval.count()},
                                {"transfer-timeout", settings.transfer_timeout.count()},
                                {"ack-timeout-ms", settings.ack_timeout.count()},
                                {"retry-backoff-ms", settings.retry_backoff.count()},
                                {"max-retries", static_cast<std::int64_t>(settings.max_retries)},
                                {"log-level", settings.log_level},
                            });
    ofs << config;
}

} // namespace lanlink::core
