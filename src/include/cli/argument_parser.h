#pragma once

#include <boost/program_options.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace lanlink::cli {

struct CliOptions {
    std::optional<std::string> device_name;
    std::optional<std::uint16_t> port;
    std::optional<std::string> save_dir;
    std::optional<std::string> log_level;
    bool show_help = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // 解析命令行参数，参数错误时抛出 std::invalid_argument
    CliOptions Parse();

    // 显示帮助信息
    void ShowHelp() const;

private:
    int argc_;
    char** argv_;
    boost::program_options::options_description description_;
    boost::program_options::positional_options_description positional_;

    // 参数验证
    void validateOptions(const CliOptions& options) const;
};

} // namespace lanlink::cli
