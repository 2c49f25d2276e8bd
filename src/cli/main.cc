#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <cli/terminal.h>
#include <core/constant/path.h>
#include <core/peer_node.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <core/util/system.h>
#include <iostream>
#include <stdexcept>

using namespace lanlink;
using namespace lanlink::core;

int main(int argc, char* argv[]) {
    cli::ArgumentParser argument_parser(argc, argv);
    cli::CliOptions cli_options;
    try {
        cli_options = argument_parser.Parse();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        argument_parser.ShowHelp();
        return 1;
    }
    if (cli_options.show_help) {
        argument_parser.ShowHelp();
        return 0;
    }

    Logger logger(
#ifdef LANLINK_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir / "lanlink.log");
    InitConfig();

    cli::Terminal terminal;

    // 命令行没有给出名字且配置文件中也没有时，询问用户并保存
    if (!cli_options.device_name && settings.device_name.empty()) {
        auto name = terminal.Ask("Device name (empty for host name): ");
        name = name.empty() ? core::system::Hostname() : name;
        settings.device_name = NormalizeDeviceName(name);
        SaveConfig();
    }

    // 命令行参数只对本次运行生效
    if (cli_options.device_name) {
        settings.device_name = NormalizeDeviceName(*cli_options.device_name);
    }
    if (cli_options.port) {
        settings.port = *cli_options.port;
    }
    if (cli_options.save_dir) {
        settings.save_dir = *cli_options.save_dir;
    }
    if (cli_options.log_level) {
        settings.log_level = *cli_options.log_level;
    }
    logger.set_log_level(Logger::ParseLevel(settings.log_level));

    cli::CliManager cli_manager(terminal);
    PeerNode node(NodeOptions::FromSettings(settings),
                  [&cli_manager](FeedbackType type, const nlohmann::json& data) {
                      cli_manager.OnFeedback(type, data);
                  });
    try {
        node.Start();
    } catch (const boost::system::system_error& e) {
        spdlog::critical("Failed to open UDP port {}: {}", settings.port, e.what());
        return 1;
    }
    cli_manager.AttachNode(node);

    spdlog::info("lanlink started as {}", settings.device_name);
    cli_manager.StartInteractiveMode();

    node.Shutdown();
    spdlog::info("lanlink stopped");
    return 0;
}
