#pragma once

#include "sixftp/interfaces/ILogger.hpp"
#include <iostream>
#include <mutex>

namespace sixftp {
namespace core {

/**
 * @brief Console logger implementation
 * Timestamped "[HH:MM:SS] [LEVEL] message" lines. Errors go to the error
 * stream, everything else to the output stream.
 */
class ConsoleLogger : public interfaces::ILogger {
public:
    explicit ConsoleLogger(interfaces::LogLevel threshold = interfaces::LogLevel::Info,
                           std::ostream& out = std::cout,
                           std::ostream& err = std::cerr);

    void log(interfaces::LogLevel level, const std::string& message) override;

    void set_threshold(interfaces::LogLevel threshold) { threshold_ = threshold; }
    interfaces::LogLevel threshold() const { return threshold_; }

    // Reads SIXFTP_LOG (error|warn|info|debug). Unset or unknown -> Info.
    static interfaces::LogLevel threshold_from_env();

private:
    interfaces::LogLevel threshold_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public interfaces::ILogger {
public:
    void log(interfaces::LogLevel, const std::string&) override {}
};

} // namespace core
} // namespace sixftp
