#include "shortkey/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace shortkey {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(LogLevel level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    }

    auto logger = std::make_shared<spdlog::logger>("shortkey", sinks.begin(), sinks.end());
    logger->set_level(to_spdlog(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %s:%# %!() - %v");
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug" || lower == "trace") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "critical") return LogLevel::ERROR;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : level_(LogLevel::INFO), logger_(make_logger(LogLevel::INFO, "")) {}

void Logger::configure(LogLevel level, const std::string& file) {
    auto logger = make_logger(level, file);
    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(logger);
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return level_.load(std::memory_order_relaxed);
}

void Logger::write(LogLevel level, const char* file, int line, const char* func,
                   const std::string& message) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logger = logger_;
    }
    logger->log(spdlog::source_loc{file, line, func}, to_spdlog(level), message);
}

} // namespace shortkey
