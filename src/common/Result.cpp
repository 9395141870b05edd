#include "sixftp/common/Result.hpp"

namespace sixftp {
namespace common {

    const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::Success:          return "Success";
            case ErrorCode::InvalidArgument:  return "InvalidArgument";
            case ErrorCode::AlreadyRunning:   return "AlreadyRunning";
            case ErrorCode::BindFailed:       return "BindFailed";
            case ErrorCode::PermissionDenied: return "PermissionDenied";
            case ErrorCode::Timeout:          return "Timeout";
            case ErrorCode::Cancelled:        return "Cancelled";
            case ErrorCode::EngineError:      return "EngineError";
            case ErrorCode::Unknown:          break;
        }
        return "Unknown";
    }

    std::string describe(const AppError& error) {
        if (error.code == ErrorCode::InvalidArgument && !error.field.empty()) {
            return "invalid " + error.field + ": " + error.message;
        }
        return error.message;
    }

} // namespace common
} // namespace sixftp
