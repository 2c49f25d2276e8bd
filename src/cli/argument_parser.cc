#include <algorithm>
#include <array>
#include <cli/argument_parser.h>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace po = boost::program_options;

namespace lanlink::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , description_("Usage: lanlink [options] [name]\nOptions") {
    // clang-format off
    description_.add_options()
        ("help,h", "Show this help information")
        ("name,n", po::value<std::string>(), "Device name announced in heartbeats")
        ("port,p", po::value<std::uint16_t>(), "UDP port for every protocol message")
        ("save-dir,d", po::value<std::string>(), "Directory for received files")
        ("log-level,l", po::value<std::string>(),
         "trace, debug, info, warn, error, critical or off");
    // clang-format on
    positional_.add("name", 1);
}

CliOptions ArgumentParser::Parse() {
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc_, argv_)
                      .options(description_)
                      .positional(positional_)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::invalid_argument(e.what());
    }

    CliOptions options;
    options.show_help = vm.count("help") > 0;
    if (vm.count("name")) {
        options.device_name = vm["name"].as<std::string>();
    }
    if (vm.count("port")) {
        options.port = vm["port"].as<std::uint16_t>();
    }
    if (vm.count("save-dir")) {
        options.save_dir = vm["save-dir"].as<std::string>();
    }
    if (vm.count("log-level")) {
        std::string level = vm["log-level"].as<std::string>();
        std::transform(level.begin(), level.end(), level.begin(), ::tolower);
        options.log_level = level;
    }

    validateOptions(options);
    return options;
}

void ArgumentParser::ShowHelp() const {
    std::cout << description_ << std::endl;
}

void ArgumentParser::validateOptions(const CliOptions& options) const {
    if (options.port && *options.port == 0) {
        throw std::invalid_argument("Port must be between 1 and 65535");
    }

    if (options.log_level) {
        constexpr std::array<std::string_view, 7> valid_levels
            = {"trace", "debug", "info", "warn", "error", "critical", "off"};
        if (std::find(valid_levels.begin(), valid_levels.end(), *options.log_level)
            == valid_levels.end()) {
            throw std::invalid_argument("Invalid log level: " + *options.log_level);
        }
    }

    if (options.device_name && options.device_name->empty()) {
        throw std::invalid_argument("Device name must not be empty");
    }
}

} // namespace lanlink::cli
