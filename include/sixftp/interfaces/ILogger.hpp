#pragma once

#include <string>

namespace sixftp {
namespace interfaces {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

/**
 * @brief Interface for logging
 * Single responsibility: Logging operations
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }
};

const char* to_string(LogLevel level);

} // namespace interfaces
} // namespace sixftp
