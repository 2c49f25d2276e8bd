#pragma once

#include "terminal.h"
#include <core/model.h>
#include <core/peer_node.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lanlink::cli {

class CliManager {
public:
    explicit CliManager(Terminal& terminal);
    ~CliManager() = default;

    void AttachNode(core::PeerNode& node) { node_ = &node; }

    // Returns false for exit/quit
    bool ProcessCommand(const std::string& command);

    // Runs until exit/quit or end of input
    void StartInteractiveMode();

    // Feedback callback of the peer node, called from its worker threads
    void OnFeedback(core::FeedbackType type, const nlohmann::json& data);

private:
    // 命令实现
    void handleListDevices();
    void handleTalk(const std::string& device_name, const std::string& text);
    void handleSendFile(const std::string& device_name, const std::string& file_path);
    void printHelp();

    void printDeviceList(const std::vector<core::DeviceInfo>& devices);

    Terminal& terminal_;
    core::PeerNode* node_ = nullptr;
};

} // namespace lanlink::cli
