#include <tmd/util/logger.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace tmd {

namespace {

std::shared_ptr<Logger>& global_logger() {
    static std::shared_ptr<Logger> instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (level < min_level_) return;

    const char* prefix = "";
    switch (level) {
        case LogLevel::DEBUG:   prefix = "[DEBUG] "; break;
        case LogLevel::INFO:    prefix = "[INFO] "; break;
        case LogLevel::WARNING: prefix = "[WARN] "; break;
        case LogLevel::ERROR:   prefix = "[ERROR] "; break;
    }

    std::cerr << prefix << message << std::endl;
}

Logger& logger() {
    return *global_logger();
}

void set_logger(std::shared_ptr<Logger> logger) {
    if (!logger) {
        logger = std::make_shared<NullLogger>();
    }
    global_logger() = std::move(logger);
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

}  // namespace tmd
