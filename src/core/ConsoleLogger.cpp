#include "sixftp/core/ConsoleLogger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <string>

namespace sixftp {

namespace interfaces {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace interfaces

namespace core {

ConsoleLogger::ConsoleLogger(interfaces::LogLevel threshold, std::ostream& out, std::ostream& err)
    : threshold_(threshold), out_(out), err_(err) {}

void ConsoleLogger::log(interfaces::LogLevel level, const std::string& message) {
    if (level < threshold_) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& os = (level == interfaces::LogLevel::Error) ? err_ : out_;
    os << "[" << std::put_time(&local_tm, "%H:%M:%S")
       << "] [" << interfaces::to_string(level) << "] " << message << std::endl;
}

interfaces::LogLevel ConsoleLogger::threshold_from_env() {
    const char* value = std::getenv("SIXFTP_LOG");
    if (!value) return interfaces::LogLevel::Info;

    std::string level(value);
    if (level == "debug") return interfaces::LogLevel::Debug;
    if (level == "warn")  return interfaces::LogLevel::Warn;
    if (level == "error") return interfaces::LogLevel::Error;
    return interfaces::LogLevel::Info;
}

} // namespace core
} // namespace sixftp
