#pragma once
#include "sixftp/interfaces/ITransferEngine.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

namespace sixftp {
namespace testing {

    class MockStorage : public interfaces::IStorageBackend {
    public:
        explicit MockStorage(std::string root) : root_(std::move(root)) {}

        const std::string& root() const override { return root_; }
        common::EmptyResult check_access() const override { return common::EmptyResult::success(); }

    private:
        std::string root_;
    };

    // Engine double: binds nothing, records calls, and can be told to fail
    // at bind time, to ignore cancellation, or to die while running.
    class MockTransferEngine : public interfaces::ITransferEngine {
    public:
        struct Behavior {
            std::optional<common::AppError> bind_error;
            bool hang_on_cancel = false;  // await_completion() never confirms
            bool force_succeeds = true;   // force_terminate() result when hanging
            bool fail_during_start = false;
        };

        struct Counters {
            std::atomic<int> created{0};
            std::atomic<int> cancelled{0};
            std::atomic<int> forced{0};
            std::atomic<int> released{0};
        };

        MockTransferEngine() : counters_(std::make_shared<Counters>()) {}
        explicit MockTransferEngine(Behavior behavior)
            : behavior_(std::move(behavior)), counters_(std::make_shared<Counters>()) {}

        void set_behavior(Behavior behavior) {
            std::lock_guard<std::mutex> lock(mutex_);
            behavior_ = std::move(behavior);
        }

        common::Result<std::unique_ptr<interfaces::IServiceHandle>> create_server(
            const core::CanonicalConfig& config,
            std::shared_ptr<interfaces::IStorageBackend>,
            interfaces::EngineFailureCallback on_failure
        ) override {
            Behavior behavior;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                behavior = behavior_;
                if (!behavior.bind_error) {
                    on_failure_ = on_failure;
                }
            }
            if (behavior.bind_error) {
                return *behavior.bind_error;
            }

            counters_->created++;
            if (behavior.fail_during_start && on_failure) {
                on_failure(common::AppError{common::ErrorCode::EngineError, "died during start", ""});
            }

            std::vector<std::string> bound;
            if (config.is_wildcard_bind()) {
                bound = {"0.0.0.0", "::"};
            } else {
                bound = {config.bind_address()};
            }
            return common::Result<std::unique_ptr<interfaces::IServiceHandle>>::ok(
                std::make_unique<Handle>(counters_, behavior, std::move(bound)));
        }

        std::shared_ptr<interfaces::IStorageBackend> make_storage(const std::string& directory) override {
            return std::make_shared<MockStorage>(directory);
        }

        const char* name() const noexcept override { return "mock engine"; }

        // Simulates the running service dying on its own
        void trigger_failure(const std::string& message) {
            interfaces::EngineFailureCallback callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                callback = on_failure_;
            }
            if (callback) {
                callback(common::AppError{common::ErrorCode::EngineError, message, ""});
            }
        }

        const Counters& counters() const { return *counters_; }

    private:
        class Handle : public interfaces::IServiceHandle {
        public:
            Handle(std::shared_ptr<Counters> counters, Behavior behavior, std::vector<std::string> bound)
                : counters_(std::move(counters)), behavior_(std::move(behavior)), bound_(std::move(bound)) {}

            ~Handle() override { counters_->released++; }

            void cancel() override {
                if (!cancelled_.exchange(true)) counters_->cancelled++;
            }

            bool await_completion(std::chrono::milliseconds timeout) override {
                if (behavior_.hang_on_cancel || !cancelled_) {
                    std::this_thread::sleep_for(timeout);
                    return false;
                }
                return true;
            }

            bool force_terminate() override {
                counters_->forced++;
                return !behavior_.hang_on_cancel || behavior_.force_succeeds;
            }

            std::vector<std::string> bound_addresses() const override { return bound_; }

        private:
            std::shared_ptr<Counters> counters_;
            Behavior behavior_;
            std::vector<std::string> bound_;
            std::atomic<bool> cancelled_{false};
        };

        std::mutex mutex_;
        Behavior behavior_;
        interfaces::EngineFailureCallback on_failure_;
        std::shared_ptr<Counters> counters_;
    };

} // namespace testing
} // namespace sixftp
