#include "statcube/logging.hpp"
#include "statcube/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace statcube {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;

    throw StatcubeException(ErrorCode::INVALID_CONFIG, "unknown log level", name);
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    LogLevel level = LogLevel::INFO;

    explicit Impl(const LogConfig& config) : level(config.level) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
        }
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        logger->set_level(to_spdlog(config.level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    Impl() : level(LogLevel::OFF) {
        logger = std::make_shared<spdlog::logger>(
            "statcube-null", std::make_shared<spdlog::sinks::null_sink_mt>());
        logger->set_level(spdlog::level::off);
    }
};

Logger::Logger(const LogConfig& config) : pImpl(std::make_unique<Impl>(config)) {}

Logger::Logger(NullTag) : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

std::shared_ptr<Logger> Logger::null() {
    return std::make_shared<Logger>(NullTag{});
}

void Logger::trace(const std::string& message) {
    pImpl->logger->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->logger->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->logger->info(message);
}

void Logger::warn(const std::string& message) {
    pImpl->logger->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->logger->error(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->level = level;
    pImpl->logger->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return pImpl->level;
}

void Logger::flush() {
    pImpl->logger->flush();
}

} // namespace statcube
