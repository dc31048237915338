#pragma once

#include <memory>
#include <optional>
#include <string>

namespace tmd {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Writes "[LEVEL] message" lines to stderr, keeping stdout free for
 * command output.
 */
class ConsoleLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

/**
 * Process-wide logger used by the library. Defaults to a NullLogger so
 * embedding applications stay quiet unless they install one.
 */
Logger& logger();

/**
 * Replace the process-wide logger. Passing nullptr restores the NullLogger.
 */
void set_logger(std::shared_ptr<Logger> logger);

/**
 * Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive).
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

}  // namespace tmd
