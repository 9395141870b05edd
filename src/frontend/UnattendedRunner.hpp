#pragma once
#include <memory>
#include <ostream>
#include "sixftp/common/Result.hpp"
#include "sixftp/core/AddressEnumerator.hpp"
#include "sixftp/core/LifecycleController.hpp"
#include "sixftp/core/StatusReporter.hpp"
#include "sixftp/interfaces/ILogger.hpp"

namespace sixftp {
namespace frontend {

// ============================================================================
// UnattendedRunner - start, report, wait for a signal, stop
// ============================================================================
// Relayed log events go to the console logger. SIGINT/SIGTERM are taken
// synchronously with sigtimedwait(), so block_termination_signals() must run
// before any thread is created.
// ============================================================================

class UnattendedRunner {
public:
    UnattendedRunner(
        core::LifecycleController& controller,
        std::shared_ptr<core::StatusReporter> reporter,
        std::shared_ptr<core::AddressEnumerator> enumerator,
        std::shared_ptr<interfaces::ILogger> console,
        std::ostream& out,
        std::ostream& err
    );
    ~UnattendedRunner();

    UnattendedRunner(const UnattendedRunner&) = delete;
    UnattendedRunner& operator=(const UnattendedRunner&) = delete;

    // Blocks SIGINT/SIGTERM in the calling thread (and threads it creates)
    static common::EmptyResult block_termination_signals();
    static common::EmptyResult unblock_termination_signals();

    // 0 after a signal-driven shutdown, 1 on start or engine failure
    int run(const core::CanonicalConfig& config);

    static constexpr int SIGNAL_POLL_MS = 200;

private:
    // Signal number, or 0 when none arrived within the timeout
    static int wait_for_signal(int timeout_ms);

    core::LifecycleController& controller_;
    std::shared_ptr<core::StatusReporter> reporter_;
    std::shared_ptr<core::AddressEnumerator> enumerator_;
    std::shared_ptr<interfaces::ILogger> console_;
    std::ostream& out_;
    std::ostream& err_;
    uint32_t subscription_ = 0;
};

} // namespace frontend
} // namespace sixftp
