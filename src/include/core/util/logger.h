#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace streamfetch {

// Routes spdlog's default logger to a daily rotated file under a log directory, and to stderr
// when console output is on. stdout stays free for JSON progress lines. The previous default
// logger is restored on destruction.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    static constexpr const char* kName = "streamfetch";
    static constexpr std::size_t kMaxFiles = 7;

    // Accepts spdlog's level names ("trace" ... "critical", "off", "warning", "err")
    static Level ParseLevel(std::string_view name) {
        std::string text(name);
        Level level = spdlog::level::from_str(text);
        // from_str falls back to off for names it does not know
        if (level == Level::off && text != "off") {
            throw std::invalid_argument("Unknown log level \"" + text + "\"");
        }
        return level;
    }

    Logger(Level level, const std::filesystem::path& directory, bool console = true)
        : previous_(spdlog::default_logger()) {
        std::filesystem::create_directories(directory);

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            stamp(fstream, "Log Start", filename);
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            stamp(fstream, "Log End", filename);
        };

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (directory / (std::string(kName) + ".log")).string(), 0, 0, false, kMaxFiles, handlers));
        if (console) {
            auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            stderr_sink->set_pattern("\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ %v");
#ifdef STREAMFETCH_RELEASE
            stderr_sink->set_level(Level::info);
#endif
            sinks.push_back(std::move(stderr_sink));
        }

        // One worker keeps the file in submission order
        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(8192, 1);
        logger_ = std::make_shared<spdlog::async_logger>(kName,
                                                         sinks.begin(),
                                                         sinks.end(),
                                                         thread_pool_,
                                                         spdlog::async_overflow_policy::block);
        logger_->set_level(level);
        logger_->flush_on(Level::warn);
        logger_->set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "streamfetch: logging failed: %s\n", msg.c_str());
        });

        spdlog::set_default_logger(logger_);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger() {
        logger_->flush();
        if (previous_) {
            spdlog::set_default_logger(previous_);
        }
        spdlog::drop(kName);
    }

    [[nodiscard]] Level level() const { return logger_->level(); }
    void set_level(Level level) { logger_->set_level(level); }

private:
    static void stamp(std::FILE* fstream, const char* what, const spdlog::filename_t& filename) {
        if (fstream) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::fprintf(fstream, "[%s: %s | %s]\n", what, filename.c_str(), std::ctime(&now));
        }
    }

    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace streamfetch
