#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace spdlog {
class logger;
}

namespace shortkey {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

LogLevel parse_log_level(const std::string& name);

/**
 * Process-wide logger. Messages are assembled from streamed arguments and
 * handed to an spdlog logger with a stderr sink and an optional file sink;
 * stdout is left to command output.
 */
class Logger {
public:
    static Logger& getInstance();

    // Rebuilds the sinks. An empty file path logs to stderr only.
    void configure(LogLevel level, const std::string& file = "");

    LogLevel level() const;

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (level < level_.load(std::memory_order_relaxed)) return;

        std::ostringstream msg;
        (msg << ... << std::forward<Args>(args));
        write(level, file, line, func, msg.str());
    }

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* file, int line, const char* func,
               const std::string& message);

    std::atomic<LogLevel> level_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(...) shortkey::Logger::getInstance().log(shortkey::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  shortkey::Logger::getInstance().log(shortkey::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  shortkey::Logger::getInstance().log(shortkey::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) shortkey::Logger::getInstance().log(shortkey::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

} // namespace shortkey
