#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace Scribe {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        logger = std::make_shared<spdlog::logger>("scribe",
            spdlog::sinks_init_list{console_sink, file_sink});
    } catch (const spdlog::spdlog_ex& ex) {
        logger = std::make_shared<spdlog::logger>("scribe_fallback",
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        logger->error("Logger initialization failed: {}", ex.what());
    }

    logger->set_level(static_cast<spdlog::level::level_enum>(level));
    logger->flush_on(spdlog::level::warn);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logger_ = logger;
    }

    SCRIBE_INFO("Logger initialized with file: {}", logFilePath);
}

void Logger::setLevel(Level level) {
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
}

Logger::Level Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        return Level::Info;
    }
    return static_cast<Level>(logger_->level());
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = std::make_shared<spdlog::logger>("scribe_console",
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        logger_->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
    }
    return logger_;
}

} // namespace Scribe
