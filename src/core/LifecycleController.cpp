#include "sixftp/core/LifecycleController.hpp"
#include "sixftp/core/ConfigNormalizer.hpp"

namespace sixftp {
namespace core {

const char* to_string(ServicePhase phase) {
    switch (phase) {
        case ServicePhase::Stopped:  return "Stopped";
        case ServicePhase::Starting: return "Starting";
        case ServicePhase::Running:  return "Running";
        case ServicePhase::Stopping: return "Stopping";
        case ServicePhase::Failed:   return "Failed";
    }
    return "Unknown";
}

// ============================================================================
// Construction / Destruction
// ============================================================================

LifecycleController::LifecycleController(
    std::shared_ptr<interfaces::ITransferEngine> engine,
    std::shared_ptr<interfaces::ILogger> logger
) : LifecycleController(std::move(engine), std::move(logger), Options{}) {}

LifecycleController::LifecycleController(
    std::shared_ptr<interfaces::ITransferEngine> engine,
    std::shared_ptr<interfaces::ILogger> logger,
    Options options
) : engine_(std::move(engine)),
    logger_(std::move(logger)),
    options_(options),
    shared_(std::make_shared<Shared>()) {}

LifecycleController::~LifecycleController() {
    auto res = stop();
    if (res.is_err()) {
        logger_->warn("[Lifecycle] Shutdown on destruction: " + res.error().message);
    }
}

// ============================================================================
// Start
// ============================================================================

common::Result<StartAck> LifecycleController::start(const CanonicalConfig& config) {
    std::unique_ptr<interfaces::IServiceHandle> leftover;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        ServicePhase phase = shared_->state.phase;

        if (phase != ServicePhase::Stopped && phase != ServicePhase::Failed) {
            return common::Result<StartAck>::err(common::ErrorCode::AlreadyRunning,
                std::string("Server is already running (state: ") + to_string(phase) + ")");
        }

        shared_->state = LifecycleState{ServicePhase::Starting, ""};
        generation = ++shared_->generation;
        leftover = std::move(handle_);
        config_.reset();
    }
    shared_->changed.notify_all();

    // A Failed instance may still hold its handle
    if (leftover) {
        leftover->cancel();
        leftover.reset();
    }

    const CanonicalConfig owned = config;
    for (const auto& warning : ConfigNormalizer::warnings(owned)) {
        logger_->warn("[Lifecycle] " + warning);
    }

    logger_->info("[Lifecycle] Starting " + std::string(engine_->name()) + " on port " +
                  std::to_string(owned.port()) + " (bind " + owned.bind_address() + ")");

    std::weak_ptr<Shared> weak_shared = shared_;
    auto logger = logger_;
    auto result = engine_->create_server(
        owned,
        engine_->make_storage(owned.directory()),
        [weak_shared, logger, generation](const common::AppError& error) {
            on_engine_failure(weak_shared, logger, generation, error);
        });

    if (result.is_err()) {
        const auto& error = result.error();
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->state = LifecycleState{ServicePhase::Failed, error.message};
        }
        shared_->changed.notify_all();
        logger_->debug("[Lifecycle] Start failed: " + error.message);
        return error;
    }

    auto handle = result.take();
    StartAck ack;
    ack.port = owned.port();
    ack.bound_addresses = handle->bound_addresses();

    std::string failure;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        handle_ = std::move(handle);
        if (shared_->state.phase == ServicePhase::Failed) {
            // Engine died between bind and now
            failure = shared_->state.failure_reason;
        } else {
            shared_->state = LifecycleState{ServicePhase::Running, ""};
            config_ = owned;
        }
    }
    shared_->changed.notify_all();

    if (!failure.empty()) {
        return common::Result<StartAck>::err(common::ErrorCode::EngineError, failure);
    }

    logger_->info("[Lifecycle] Server running on " + std::to_string(ack.bound_addresses.size()) +
                  " address(es)");
    return ack;
}

// ============================================================================
// Stop
// ============================================================================

common::Result<StopAck> LifecycleController::stop() {
    std::unique_ptr<interfaces::IServiceHandle> handle;
    bool was_running = false;

    {
        std::unique_lock<std::mutex> lock(shared_->mutex);

        // Let an in-flight start or stop settle first
        shared_->changed.wait(lock, [this] {
            ServicePhase p = shared_->state.phase;
            return p != ServicePhase::Starting && p != ServicePhase::Stopping;
        });

        ServicePhase phase = shared_->state.phase;
        if (phase == ServicePhase::Stopped) {
            return StopAck{};
        }

        handle = std::move(handle_);
        config_.reset();

        if (phase == ServicePhase::Running) {
            shared_->state = LifecycleState{ServicePhase::Stopping, ""};
            was_running = true;
        } else if (!handle) {
            // Failed with nothing left to release
            return StopAck{};
        }
    }
    shared_->changed.notify_all();

    if (was_running) logger_->info("[Lifecycle] Stopping server...");

    auto result = shutdown_handle(std::move(handle), was_running);

    if (was_running) {
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->state = LifecycleState{ServicePhase::Stopped, ""};
        }
        shared_->changed.notify_all();
        logger_->info("[Lifecycle] Server stopped");
    }

    return result;
}

common::Result<StopAck> LifecycleController::shutdown_handle(
    std::unique_ptr<interfaces::IServiceHandle> handle,
    bool was_running
) {
    StopAck ack;
    ack.was_running = was_running;
    if (!handle) return ack;

    handle->cancel();
    bool confirmed = handle->await_completion(options_.grace_period);

    if (!confirmed) {
        logger_->warn("[Lifecycle] Service did not stop within " +
                      std::to_string(options_.grace_period.count()) + "ms, forcing termination");
        ack.forced = true;
        confirmed = handle->force_terminate();
    }

    handle.reset();

    if (!confirmed) {
        logger_->error("[Lifecycle] Forced termination could not be confirmed");
        return common::Result<StopAck>::err(common::ErrorCode::Timeout,
            "Service did not confirm termination");
    }
    return ack;
}

// ============================================================================
// Engine Callbacks
// ============================================================================

void LifecycleController::on_engine_failure(
    const std::weak_ptr<Shared>& weak_shared,
    const std::shared_ptr<interfaces::ILogger>& logger,
    uint64_t generation,
    const common::AppError& error
) {
    auto shared = weak_shared.lock();
    if (!shared) return;

    bool applied = false;
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        ServicePhase phase = shared->state.phase;
        if (shared->generation == generation &&
            (phase == ServicePhase::Starting || phase == ServicePhase::Running)) {
            shared->state = LifecycleState{ServicePhase::Failed, error.message};
            applied = true;
        }
    }
    shared->changed.notify_all();

    if (applied) {
        logger->error("[Lifecycle] Service failed: " + error.message);
    }
}

// ============================================================================
// Queries
// ============================================================================

LifecycleState LifecycleController::current_state() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->state;
}

std::optional<CanonicalConfig> LifecycleController::active_config() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return config_;
}

ServicePhase LifecycleController::wait_until_finished(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    shared_->changed.wait_for(lock, timeout, [this] {
        ServicePhase p = shared_->state.phase;
        return p != ServicePhase::Starting && p != ServicePhase::Running;
    });
    return shared_->state.phase;
}

} // namespace core
} // namespace sixftp
