#include <chrono>
#include <cli/cli_manager.h>
#include <filesystem>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <sstream>

namespace fs = std::filesystem;

using namespace lanlink::core;

namespace lanlink::cli {

namespace {

std::string TrimLeft(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    return begin == std::string::npos ? std::string{} : s.substr(begin);
}

} // namespace

CliManager::CliManager(Terminal& terminal)
    : terminal_(terminal) {}

void CliManager::StartInteractiveMode() {
    terminal_.PrintInfo("Type \"help\" for the list of commands.");
    while (true) {
        terminal_.PrintPrompt();
        auto command = terminal_.ReadLine();
        if (!command || !ProcessCommand(*command)) {
            break;
        }
    }
}

bool CliManager::ProcessCommand(const std::string& command) {
    std::istringstream iss(command);
    std::string cmd;
    if (!(iss >> cmd)) {
        return true;
    }

    if (cmd == "exit" || cmd == "quit") {
        return false;
    }
    if (cmd == "devices") {
        handleListDevices();
    } else if (cmd == "talk" || cmd == "sendfile") {
        std::string device_name;
        std::string rest;
        iss >> device_name;
        std::getline(iss, rest);
        rest = TrimLeft(rest);
        if (device_name.empty() || rest.empty()) {
            terminal_.PrintError(cmd == "talk"
                                     ? "args too less, correct format: talk <name> <message>"
                                     : "args too less, correct format: sendfile <name> <path>");
        } else if (cmd == "talk") {
            handleTalk(device_name, rest);
        } else {
            handleSendFile(device_name, rest);
        }
    } else if (cmd == "help") {
        printHelp();
    } else if (cmd == "clear") {
        terminal_.ClearScreen();
    } else {
        terminal_.PrintError("unknown command: " + cmd);
    }
    return true;
}

void CliManager::handleListDevices() {
    if (!node_) {
        return;
    }
    printDeviceList(node_->ListDevices());
}

void CliManager::handleTalk(const std::string& device_name, const std::string& text) {
    if (!node_) {
        return;
    }
    auto result = node_->SendMessage(device_name, text);
    if (result == SendResult::kSuccess) {
        terminal_.PrintInfo(fmt::format("message delivered to {}", device_name));
    } else {
        terminal_.PrintError(
            fmt::format("message to {} failed: {}", device_name, ToString(result)));
    }
}

void CliManager::handleSendFile(const std::string& device_name, const std::string& file_path) {
    if (!node_) {
        return;
    }
    auto result = node_->SendFile(device_name, fs::path(file_path));
    if (result == SendResult::kQueued) {
        terminal_.PrintInfo(fmt::format("start sending {} to {}", file_path, device_name));
    } else {
        terminal_.PrintError(
            fmt::format("send file {} to {} failed: {}", file_path, device_name, ToString(result)));
    }
}

void CliManager::OnFeedback(FeedbackType type, const nlohmann::json& data) {
    try {
        switch (type) {
        case FeedbackType::kFoundDevice: {
            auto device = data.get<feedback::FoundDevice>();
            terminal_.PrintInfo(
                fmt::format("device found: {} ({})", device.device_name, device.ip_address));
            break;
        }
        case FeedbackType::kLostDevice: {
            auto device = data.get<feedback::LostDevice>();
            terminal_.PrintInfo(fmt::format("device lost: {}", device.device_name));
            break;
        }
        case FeedbackType::kMessageReceived: {
            auto message = data.get<feedback::MessageReceived>();
            terminal_.Print(fmt::format("[{}] {}", message.sender, message.text));
            break;
        }
        case FeedbackType::kFileReceivingStarted: {
            auto started = data.get<feedback::FileReceivingStarted>();
            terminal_.PrintInfo(fmt::format("receiving {} ({} bytes) from {}",
                                            started.filename,
                                            started.file_size,
                                            started.sender));
            break;
        }
        case FeedbackType::kFileReceivingCompleted: {
            auto completed = data.get<feedback::FileReceivingCompleted>();
            terminal_.PrintInfo(fmt::format("received {} from {}, saved to {}",
                                            completed.filename,
                                            completed.sender,
                                            completed.saved_path));
            break;
        }
        case FeedbackType::kReceiveSessionEnded: {
            auto ended = data.get<feedback::ReceiveSessionEnd>();
            if (!ended.success) {
                terminal_.PrintError(
                    fmt::format("receiving {} failed: {}", ended.filename, ended.error_message));
            }
            break;
        }
        case FeedbackType::kSendSessionEnded: {
            auto ended = data.get<feedback::SendSessionEnd>();
            if (ended.result == SendResult::kSuccess) {
                terminal_.PrintInfo(
                    fmt::format("{} sent to {}", ended.filename, ended.device_name));
            } else {
                terminal_.PrintError(fmt::format("sending {} to {} failed: {}",
                                                 ended.filename,
                                                 ended.device_name,
                                                 ended.error_message));
            }
            break;
        }
        case FeedbackType::kFileReceivingProgress:
        case FeedbackType::kFileSendingProgress:
            // 进度已经写入日志
            break;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Malformed feedback payload: {}", e.what());
    }
}

void CliManager::printDeviceList(const std::vector<DeviceInfo>& devices) {
    if (devices.empty()) {
        terminal_.PrintInfo("no devices found yet");
        return;
    }
    auto now = std::chrono::steady_clock::now();
    std::string table = fmt::format("{:<20} {:<16} {:<6} {}\n", "NAME", "ADDRESS", "PORT", "SEEN");
    for (const auto& device : devices) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now - device.last_seen);
        table += fmt::format("{:<20} {:<16} {:<6} {}s ago\n",
                             device.name,
                             device.ip_address,
                             device.port,
                             seconds.count());
    }
    table.pop_back();
    terminal_.Print(table);
}

void CliManager::printHelp() {
    terminal_.PrintInfo("Available commands are as follows:");
    terminal_.PrintInfo("  devices - List devices heard from recently");
    terminal_.PrintInfo("  talk <name> <message> - Send a text message to the device");
    terminal_.PrintInfo("  sendfile <name> <path> - Send a file to the device");
    terminal_.PrintInfo("  clear - Clear the screen");
    terminal_.PrintInfo("  help - Show this help information");
    terminal_.PrintInfo("  exit/quit - Exit the program");
}

} // namespace lanlink::cli
