/**
 * @file Logger.hpp
 * @brief spdlog setup and the LOG_* macros used across lyricglow.
 *
 * One named logger writes to the terminal and to a rotating file in the
 * cache directory. The macros go through SPDLOG_LOGGER_* so the file sink
 * records source locations; the build keeps every level compiled in and
 * filters at runtime.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace lg {

class Logger {
public:
    static constexpr std::size_t kMaxFileBytes = 5 * 1024 * 1024;
    static constexpr std::size_t kMaxFiles = 3;

    // Console plus a rotating file under <cache>/logs. Falls back to the
    // console alone if the file sink cannot be created.
    static void init(std::string_view appName = "lyricglow",
                     bool debug = false);
    // Flushes and drops the sinks. Logging after this is discarded until
    // the next init().
    static void shutdown();

    // Switches between debug and info after init (config file, --debug)
    static void setDebug(bool debug);

    // Empty when running console-only
    static const std::filesystem::path& logFile() {
        return logFile_;
    }

    // Initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(lg::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(lg::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(lg::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(lg::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(lg::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(lg::Logger::get(), __VA_ARGS__)

} // namespace lg
