#pragma once
#include <variant>
#include <string>
#include <stdexcept>

namespace sixftp {
namespace common {

    struct Ok {};

    enum class ErrorCode {
        Success = 0,
        InvalidArgument,  // Bad operator input (ValidationError)
        AlreadyRunning,   // start() while a service instance exists
        BindFailed,       // Listen socket could not be bound
        PermissionDenied,
        Timeout,          // Forced termination could not be confirmed
        Cancelled,        // Clean stop (Expected)
        EngineError,      // Unrecoverable engine failure while running
        Unknown
    };

    const char* to_string(ErrorCode code);

    struct AppError {
        ErrorCode code;
        std::string message;
        std::string field; // Offending input field (InvalidArgument only)
    };

    template <typename T = Ok>
    class Result {
        std::variant<T, AppError> value;

    public:
        // Constructors
        Result(T v) : value(std::move(v)) {}
        Result(AppError e) : value(std::move(e)) {}

        // Static Builders
        static Result<T> ok(T v) { return Result(std::move(v)); }

        static Result<T> err(ErrorCode code, const std::string& msg, const std::string& field = "") {
            return Result(AppError{code, msg, field});
        }

        // Checkers
        bool is_ok() const { return std::holds_alternative<T>(value); }
        bool is_err() const { return std::holds_alternative<AppError>(value); }

        // Unwrappers
        const T& unwrap() const {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::unwrap failed: " + e.message);
            }
            return std::get<T>(value);
        }

        // Moves the value out (for move-only payloads)
        T take() {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::take failed: " + e.message);
            }
            return std::move(std::get<T>(value));
        }

        const AppError& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error called on success value");
            }
            return std::get<AppError>(value);
        }

        // For void-like results (Result<Ok>)
        static Result<Ok> success() { return Result<Ok>(Ok{}); }
    };

    using EmptyResult = Result<Ok>;

    // "field: message" for InvalidArgument, plain message otherwise
    std::string describe(const AppError& error);

} // namespace common
} // namespace sixftp
