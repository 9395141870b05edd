#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "sixftp/core/AddressEnumerator.hpp"
#include "sixftp/core/ConfigNormalizer.hpp"
#include "sixftp/core/LifecycleController.hpp"
#include "sixftp/core/StatusReporter.hpp"
#include "sixftp/core/ThreadPool.hpp"

namespace sixftp {
namespace core {

// ============================================================================
// ControlPlane - API offered to an event-driven presentation layer
// ============================================================================
// Every call returns promptly. request_stop() hands the blocking part of
// stop() to a worker thread and reports completion as a LogEvent from
// source "ControlPlane". Failures (validation, start errors) are both
// returned and relayed, so a front-end that only listens to events still
// sees them.
// ============================================================================

class ControlPlane {
public:
    ControlPlane(
        LifecycleController& controller,
        std::shared_ptr<StatusReporter> reporter,
        std::shared_ptr<AddressEnumerator> enumerator
    );
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    // Normalize the form fields and start the server
    common::Result<StartAck> submit_config(const FieldMap& fields);

    // No-op success when stopped or when a stop is already in flight;
    // otherwise ack.pending is set and completion arrives as an event
    common::Result<StopAck> request_stop();

    uint32_t subscribe_log_events(LogCallback callback);
    void unsubscribe_log_events(uint32_t subscriber_id);

    LifecycleState query_state() const;

    // Connection summary for the running instance (empty when not running)
    std::vector<std::string> connection_summary() const;

    // Waits for an in-flight request_stop(). True when none is pending.
    bool wait_for_pending_stop(std::chrono::milliseconds timeout);

private:
    void relay(interfaces::LogLevel level, const std::string& message);

    LifecycleController& controller_;
    std::shared_ptr<StatusReporter> reporter_;
    std::shared_ptr<AddressEnumerator> enumerator_;

    std::atomic<bool> stop_in_flight_{false};
    mutable std::mutex pending_mutex_;
    std::future<void> pending_stop_;
    std::vector<std::string> last_bindings_;

    // Declared last: joined first on destruction
    ThreadPool workers_{1};
};

} // namespace core
} // namespace sixftp
