#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <string>

namespace Scribe {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    /**
     * @brief Installs the console and rotating file sinks.
     *
     * Until this is called every message goes to a console-only logger, so
     * components can log from tests and tools that never initialize logging.
     */
    void initialize(const std::string& logFilePath = "scribe.log",
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        get()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        get()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> get();

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define SCRIBE_TRACE(...) Scribe::Logger::instance().trace(__VA_ARGS__)
#define SCRIBE_DEBUG(...) Scribe::Logger::instance().debug(__VA_ARGS__)
#define SCRIBE_INFO(...) Scribe::Logger::instance().info(__VA_ARGS__)
#define SCRIBE_WARN(...) Scribe::Logger::instance().warn(__VA_ARGS__)
#define SCRIBE_ERROR(...) Scribe::Logger::instance().error(__VA_ARGS__)
#define SCRIBE_CRITICAL(...) Scribe::Logger::instance().critical(__VA_ARGS__)

} // namespace Scribe
