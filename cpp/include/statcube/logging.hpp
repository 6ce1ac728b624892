#pragma once

#include <memory>
#include <string>

namespace statcube {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Accepts trace, debug, info, warn/warning, error, critical, off (any case)
LogLevel parse_log_level(const std::string& name);

struct LogConfig {
    LogLevel level = LogLevel::INFO;
    std::string file;            // empty: no file sink
    bool console_output = true;
    std::string name = "statcube";
};

/**
 * Log sink handed to the I/O layer (fetcher, document reader, collection walk).
 * Instances are created by the caller and passed in explicitly; the library
 * keeps no process-wide logger.
 */
class Logger {
public:
    explicit Logger(const LogConfig& config = LogConfig{});
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Logger that discards everything
    static std::shared_ptr<Logger> null();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;
    void flush();

private:
    // Only Logger can name the tag, so only null() reaches the discarding constructor
    struct NullTag {
        explicit NullTag() = default;
    };

public:
    explicit Logger(NullTag);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace statcube
