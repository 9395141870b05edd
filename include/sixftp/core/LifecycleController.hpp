#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "sixftp/common/Result.hpp"
#include "sixftp/core/CanonicalConfig.hpp"
#include "sixftp/interfaces/ILogger.hpp"
#include "sixftp/interfaces/ITransferEngine.hpp"

namespace sixftp {
namespace core {

    enum class ServicePhase {
        Stopped,
        Starting,
        Running,
        Stopping,
        Failed
    };

    const char* to_string(ServicePhase phase);

    struct LifecycleState {
        ServicePhase phase = ServicePhase::Stopped;
        std::string failure_reason; // Set for Failed only
    };

    struct StartAck {
        uint16_t port = 0;
        std::vector<std::string> bound_addresses;
    };

    struct StopAck {
        bool was_running = false; // false: nothing to stop (no-op)
        bool forced = false;      // grace period expired, sockets torn down
        bool pending = false;     // stop runs in the background (ControlPlane)
    };

    // ========================================================================
    // LifecycleController
    // ========================================================================
    // Sole owner of the service instance and of its state.
    //
    //   Stopped -> Starting -> Running -> Stopping -> Stopped
    //   Starting/Running -> Failed (bind error, engine died)
    //   Failed -> Starting (next start)
    //
    // Thread Safety: start/stop/current_state may be called from any thread.
    // start() never waits for a transition: it is rejected with
    // AlreadyRunning unless the phase is Stopped or Failed. stop() waits for
    // an in-flight transition to settle, then acts on the settled phase, so
    // a second concurrent stop() returns the no-op result.
    // ========================================================================
    class LifecycleController {
    public:
        struct Options {
            std::chrono::milliseconds grace_period{3000};
        };

        LifecycleController(
            std::shared_ptr<interfaces::ITransferEngine> engine,
            std::shared_ptr<interfaces::ILogger> logger
        );
        LifecycleController(
            std::shared_ptr<interfaces::ITransferEngine> engine,
            std::shared_ptr<interfaces::ILogger> logger,
            Options options
        );
        ~LifecycleController();

        LifecycleController(const LifecycleController&) = delete;
        LifecycleController& operator=(const LifecycleController&) = delete;

        // The config is copied; the caller's instance is never referenced again
        common::Result<StartAck> start(const CanonicalConfig& config);

        // Blocks for at most the grace period (plus forced teardown)
        common::Result<StopAck> stop();

        LifecycleState current_state() const;
        bool is_running() const { return current_state().phase == ServicePhase::Running; }

        // Config of the running instance, if any
        std::optional<CanonicalConfig> active_config() const;

        // Blocks until the phase is neither Starting nor Running, or until
        // the timeout passes. Returns the phase observed.
        ServicePhase wait_until_finished(std::chrono::milliseconds timeout) const;

    private:
        // State shared with engine callbacks, which may outlive the controller
        struct Shared {
            mutable std::mutex mutex;
            mutable std::condition_variable changed;
            LifecycleState state;
            uint64_t generation = 0;
        };

        static void on_engine_failure(
            const std::weak_ptr<Shared>& weak_shared,
            const std::shared_ptr<interfaces::ILogger>& logger,
            uint64_t generation,
            const common::AppError& error
        );

        common::Result<StopAck> shutdown_handle(
            std::unique_ptr<interfaces::IServiceHandle> handle,
            bool was_running
        );

    private:
        std::shared_ptr<interfaces::ITransferEngine> engine_;
        std::shared_ptr<interfaces::ILogger> logger_;
        Options options_;

        std::shared_ptr<Shared> shared_;

        // Guarded by shared_->mutex
        std::unique_ptr<interfaces::IServiceHandle> handle_;
        std::optional<CanonicalConfig> config_;
    };

} // namespace core
} // namespace sixftp
