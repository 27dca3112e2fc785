#include "Logger.hpp"
#include <spdlog/sinks/null_sink.h>
#include <vector>
#include "util/FileUtils.hpp"

namespace lg {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {

constexpr const char* kConsolePattern = "%^[%H:%M:%S.%e] [%l]%$ %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v";

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

spdlog::sink_ptr makeConsoleSink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern(kConsolePattern);
    return sink;
}

// Throws spdlog_ex when the file cannot be opened
spdlog::sink_ptr makeFileSink(const std::filesystem::path& path) {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), Logger::kMaxFileBytes, Logger::kMaxFiles);
    sink->set_pattern(kFilePattern);
    return sink;
}

} // namespace

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    spdlog::drop(name);
    logFile_.clear();

    std::vector<spdlog::sink_ptr> sinks{makeConsoleSink()};
    std::string fileError;

    auto logDir = file::cacheDir() / "logs";
    if (file::ensureDir(logDir)) {
        auto path = logDir / (name + ".log");
        try {
            sinks.push_back(makeFileSink(path));
            logFile_ = path;
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    } else {
        fileError = "cannot create " + logDir.string();
    }

    logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger_->set_level(levelFor(debug));
    logger_->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    if (!fileError.empty())
        LOG_WARN("Logging to console only: {}", fileError);
    LOG_DEBUG("Logger ready (debug: {}, file: {})",
              debug,
              logFile_.empty() ? std::string("none") : logFile_.string());
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
    LOG_DEBUG("Debug logging enabled");
}

void Logger::shutdown() {
    if (logger_)
        logger_->flush();
    spdlog::shutdown();

    // Destructors that run after teardown still log through get()
    logger_ = std::make_shared<spdlog::logger>(
            "quiet", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger_->set_level(spdlog::level::off);
    logFile_.clear();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_)
        init();
    return logger_;
}

} // namespace lg
