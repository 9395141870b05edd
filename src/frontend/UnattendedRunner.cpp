#include "UnattendedRunner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

// POSIX headers
#include <signal.h>

namespace sixftp {
namespace frontend {

namespace {

sigset_t termination_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

UnattendedRunner::UnattendedRunner(
    core::LifecycleController& controller,
    std::shared_ptr<core::StatusReporter> reporter,
    std::shared_ptr<core::AddressEnumerator> enumerator,
    std::shared_ptr<interfaces::ILogger> console,
    std::ostream& out,
    std::ostream& err
) : controller_(controller),
    reporter_(std::move(reporter)),
    enumerator_(std::move(enumerator)),
    console_(std::move(console)),
    out_(out),
    err_(err) {
    auto console_sink = console_;
    subscription_ = reporter_->subscribe([console_sink](const core::LogEvent& event) {
        console_sink->log(event.level, event.message);
    });
}

UnattendedRunner::~UnattendedRunner() {
    reporter_->unsubscribe(subscription_);
}

common::EmptyResult UnattendedRunner::block_termination_signals() {
    sigset_t set = termination_set();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        return common::EmptyResult::err(common::ErrorCode::Unknown,
            std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
    return common::EmptyResult::success();
}

common::EmptyResult UnattendedRunner::unblock_termination_signals() {
    sigset_t set = termination_set();
    int rc = pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
    if (rc != 0) {
        return common::EmptyResult::err(common::ErrorCode::Unknown,
            std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
    return common::EmptyResult::success();
}

int UnattendedRunner::wait_for_signal(int timeout_ms) {
    sigset_t set = termination_set();
    struct timespec timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_nsec = static_cast<long>(timeout_ms % 1000) * 1000000L;

    siginfo_t info;
    int sig = sigtimedwait(&set, &info, &timeout);
    return sig > 0 ? sig : 0;
}

int UnattendedRunner::run(const core::CanonicalConfig& config) {
    auto started = controller_.start(config);
    if (started.is_err()) {
        err_ << "Error: " << common::describe(started.error()) << std::endl;
        return 1;
    }

    auto summary = core::StatusReporter::describe(
        config, enumerator_->list_addresses(), started.unwrap().bound_addresses);
    for (const auto& line : summary) {
        out_ << line << std::endl;
    }
    out_ << std::endl << "   Press Ctrl+C to stop the server" << std::endl;

    const auto half_poll = std::chrono::milliseconds(SIGNAL_POLL_MS / 2);
    int exit_code = 0;
    while (true) {
        int sig = wait_for_signal(SIGNAL_POLL_MS / 2);
        if (sig != 0) {
            console_->info(std::string("[Main] Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM"));
            break;
        }

        auto phase = controller_.wait_until_finished(half_poll);
        if (phase == core::ServicePhase::Failed) {
            err_ << "Error: server failed: " << controller_.current_state().failure_reason << std::endl;
            exit_code = 1;
            break;
        }
        if (phase == core::ServicePhase::Stopped) {
            break;
        }
    }

    auto stopped = controller_.stop();
    if (stopped.is_err()) {
        err_ << "Error: " << stopped.error().message << std::endl;
        exit_code = 1;
    }
    return exit_code;
}

} // namespace frontend
} // namespace sixftp
