#pragma once
#include "sixftp/interfaces/ILogger.hpp"
#include "sixftp/interfaces/ITransferEngine.hpp"
#include <chrono>
#include <memory>

namespace sixftp {
namespace platform {
namespace linux_os {

// ============================================================================
// PosixFtpEngine - in-tree transfer engine
// ============================================================================
// Binds the control port with plain POSIX sockets and serves the control
// channel only:
//   - 220 greeting on connect
//   - USER / PASS checked against the configured credentials
//   - NOOP, SYST, QUIT
//   - 502 for every other command (data transfers are not provided)
//
// Threads:
//   - one accept thread per instance, poll()-driven so cancellation is
//     noticed within POLL_INTERVAL_MS
//   - one detached thread per client; it holds a reference to the
//     instance state, so a forced teardown never frees memory under it
//
// A wildcard bind address listens on both 0.0.0.0 and :: (IPV6_V6ONLY).
// The instance starts when at least one of them binds.
// ============================================================================

class PosixFtpEngine final : public interfaces::ITransferEngine {
public:
    static constexpr const char* GREETING = "Welcome to SixFTP Server";
    static constexpr int POLL_INTERVAL_MS = 100;
    static constexpr int LISTEN_BACKLOG = 16;
    static constexpr size_t MAX_LINE_LENGTH = 4096;

    explicit PosixFtpEngine(std::shared_ptr<interfaces::ILogger> logger);

    common::Result<std::unique_ptr<interfaces::IServiceHandle>> create_server(
        const core::CanonicalConfig& config,
        std::shared_ptr<interfaces::IStorageBackend> storage,
        interfaces::EngineFailureCallback on_failure
    ) override;

    std::shared_ptr<interfaces::IStorageBackend> make_storage(const std::string& directory) override;

    const char* name() const noexcept override { return "SixFTP engine"; }

private:
    std::shared_ptr<interfaces::ILogger> logger_;
};

} // namespace linux_os
} // namespace platform
} // namespace sixftp
