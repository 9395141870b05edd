#pragma once
#include <atomic>
#include <memory>

namespace sixftp {
namespace common {

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by the service handle
    class CancellationSource {
        CancellationToken token;

    public:
        // Set with RELEASE memory order (flushes prior writes)
        void cancel() {
            if (token.state) {
                token.state->requested.store(true, std::memory_order_release);
            }
        }

        bool is_cancelled() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }
    };

} // namespace common
} // namespace sixftp
