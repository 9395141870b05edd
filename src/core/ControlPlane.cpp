#include "sixftp/core/ControlPlane.hpp"

namespace sixftp {
namespace core {

ControlPlane::ControlPlane(
    LifecycleController& controller,
    std::shared_ptr<StatusReporter> reporter,
    std::shared_ptr<AddressEnumerator> enumerator
) : controller_(controller),
    reporter_(std::move(reporter)),
    enumerator_(std::move(enumerator)) {}

ControlPlane::~ControlPlane() {
    workers_.shutdown();
}

void ControlPlane::relay(interfaces::LogLevel level, const std::string& message) {
    reporter_->relay(LogEvent{level, "ControlPlane", "[ControlPlane] " + message});
}

// ============================================================================
// Start
// ============================================================================

common::Result<StartAck> ControlPlane::submit_config(const FieldMap& fields) {
    auto config = ConfigNormalizer::normalize(fields);
    if (config.is_err()) {
        relay(interfaces::LogLevel::Error, common::describe(config.error()));
        return config.error();
    }

    auto result = controller_.start(config.unwrap());
    if (result.is_err()) {
        relay(interfaces::LogLevel::Error, "Start failed: " + result.error().message);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        last_bindings_ = result.unwrap().bound_addresses;
    }
    relay(interfaces::LogLevel::Info, "Server running");
    return result;
}

// ============================================================================
// Stop
// ============================================================================

common::Result<StopAck> ControlPlane::request_stop() {
    if (controller_.current_state().phase == ServicePhase::Stopped) {
        return StopAck{};
    }

    bool expected = false;
    if (!stop_in_flight_.compare_exchange_strong(expected, true)) {
        return StopAck{};
    }

    relay(interfaces::LogLevel::Info, "Stopping server...");

    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_stop_ = workers_.submit([this]() {
        auto res = controller_.stop();
        if (res.is_err()) {
            relay(interfaces::LogLevel::Error, "Stop: " + res.error().message);
        } else if (res.unwrap().was_running) {
            relay(interfaces::LogLevel::Info, "Server stopped");
        }
        stop_in_flight_.store(false);
    });

    StopAck ack;
    ack.was_running = true;
    ack.pending = true;
    return ack;
}

bool ControlPlane::wait_for_pending_stop(std::chrono::milliseconds timeout) {
    std::future<void> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!pending_stop_.valid()) return true;
        pending = std::move(pending_stop_);
    }

    if (pending.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!pending_stop_.valid()) pending_stop_ = std::move(pending);
        return false;
    }
    pending.get();
    return true;
}

// ============================================================================
// Queries / Subscriptions
// ============================================================================

uint32_t ControlPlane::subscribe_log_events(LogCallback callback) {
    return reporter_->subscribe(std::move(callback));
}

void ControlPlane::unsubscribe_log_events(uint32_t subscriber_id) {
    reporter_->unsubscribe(subscriber_id);
}

LifecycleState ControlPlane::query_state() const {
    return controller_.current_state();
}

std::vector<std::string> ControlPlane::connection_summary() const {
    auto config = controller_.active_config();
    if (!config) return {};

    std::vector<std::string> bound;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        bound = last_bindings_;
    }
    return StatusReporter::describe(*config, enumerator_->list_addresses(), bound);
}

} // namespace core
} // namespace sixftp
