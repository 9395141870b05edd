#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "sixftp/common/Result.hpp"
#include "sixftp/core/CanonicalConfig.hpp"
#include "sixftp/interfaces/IStorageBackend.hpp"

namespace sixftp {
namespace interfaces {

    // Called from the service thread when the running service dies on its own
    using EngineFailureCallback = std::function<void(const common::AppError&)>;

    // ========================================================================
    // IServiceHandle - one running server instance
    // ========================================================================
    // Contract:
    // 1. The listening socket(s) are already bound when the handle exists.
    // 2. cancel() only signals; it never blocks.
    // 3. await_completion() blocks up to 'timeout' and reports whether every
    //    execution context of the instance has exited.
    // 4. force_terminate() tears down sockets so blocked contexts wake up;
    //    returns true once completion is confirmed.
    // 5. Destroying the handle cancels, forces termination if the instance
    //    has not completed, and detaches whatever still refuses to exit.
    // ========================================================================
    class IServiceHandle {
    public:
        virtual ~IServiceHandle() = default;

        virtual void cancel() = 0;
        virtual bool await_completion(std::chrono::milliseconds timeout) = 0;
        virtual bool force_terminate() = 0;

        // "0.0.0.0", "::" or the concrete bind literal(s) that were bound
        virtual std::vector<std::string> bound_addresses() const = 0;
    };

    // ========================================================================
    // ITransferEngine - produces running server instances
    // ========================================================================
    // create_server binds synchronously and returns only after the service
    // has its own execution context. Errors:
    //   BindFailed, PermissionDenied, EngineError
    // ========================================================================
    class ITransferEngine {
    public:
        virtual ~ITransferEngine() = default;

        virtual common::Result<std::unique_ptr<IServiceHandle>> create_server(
            const core::CanonicalConfig& config,
            std::shared_ptr<IStorageBackend> storage,
            EngineFailureCallback on_failure
        ) = 0;

        // Builds the storage backend for a served directory
        virtual std::shared_ptr<IStorageBackend> make_storage(const std::string& directory) = 0;

        virtual const char* name() const noexcept = 0;
    };

} // namespace interfaces
} // namespace sixftp
