#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace lanlink {

class Logger {
public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& filepath,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        std::error_code ec;
        std::filesystem::create_directories(filepath.parent_path(), ec);

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(filepath.string(),
                                                                             0,
                                                                             0,
                                                                             false,
                                                                             7,
                                                                             handlers);
        auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        logger_ = std::make_shared<spdlog::async_logger>("lanlink",
                                                         spdlog::sinks_init_list{file_sink,
                                                                                 stdout_sink},
                                                         thread_pool_,
                                                         spdlog::async_overflow_policy::block);

#ifdef LANLINK_RELEASE
        stdout_sink->set_level(Level::warn);
#endif
        logger_->set_level(level);
        logger_->flush_on(Level::warn);
        logger_->set_error_handler(
            [](const std::string& msg) { std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str()); });

        stdout_sink->set_pattern("\033[36m[%H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }

    // Unknown names map to info
    static Level ParseLevel(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == Level::off && name != "off") {
            return Level::info;
        }
        return level;
    }

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

private:
    std::shared_ptr<spdlog::async_logger> logger_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace lanlink
