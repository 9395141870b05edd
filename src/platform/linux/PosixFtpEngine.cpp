#include "PosixFtpEngine.hpp"
#include "LocalStorageBackend.hpp"
#include "core/network/TcpSocket.hpp"
#include "sixftp/common/Cancellation.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>

// POSIX headers
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sixftp {
namespace platform {
namespace linux_os {

namespace {

using common::ErrorCode;
using core::network::SocketError;
using core::network::TcpSocket;

constexpr std::chrono::milliseconds FORCE_CONFIRM_TIMEOUT{1000};

std::string endpoint(const std::string& literal, uint16_t port) {
    if (literal.find(':') != std::string::npos) {
        return "[" + literal + "]:" + std::to_string(port);
    }
    return literal + ":" + std::to_string(port);
}

// ============================================================================
// Instance State (shared by the handle, accept thread and sessions)
// ============================================================================

struct Listener {
    int fd;
    std::string address;
};

struct InstanceState {
    InstanceState(
        const core::CanonicalConfig& cfg,
        std::shared_ptr<interfaces::IStorageBackend> storage_backend,
        std::shared_ptr<interfaces::ILogger> log,
        interfaces::EngineFailureCallback failure_cb
    ) : config(cfg),
        storage(std::move(storage_backend)),
        logger(std::move(log)),
        on_failure(std::move(failure_cb)) {}

    const core::CanonicalConfig config;
    const std::shared_ptr<interfaces::IStorageBackend> storage;
    const std::shared_ptr<interfaces::ILogger> logger;
    const interfaces::EngineFailureCallback on_failure;
    common::CancellationSource cancel_source;

    std::mutex mutex;
    std::condition_variable finished;
    std::vector<Listener> listeners;
    std::set<int> clients;
    size_t active_sessions = 0;
    bool accept_exited = false;

    bool completed_locked() const { return accept_exited && active_sessions == 0; }
};

// ============================================================================
// Binding
// ============================================================================

common::Result<int> bind_listener(const std::string& literal, uint16_t port) {
    struct sockaddr_storage addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t addr_len = 0;
    int family = AF_INET;

    in_addr v4{};
    in6_addr v6{};
    if (inet_pton(AF_INET, literal.c_str(), &v4) == 1) {
        auto* sa = reinterpret_cast<struct sockaddr_in*>(&addr);
        sa->sin_family = AF_INET;
        sa->sin_port = htons(port);
        sa->sin_addr = v4;
        addr_len = sizeof(struct sockaddr_in);
    } else if (inet_pton(AF_INET6, literal.c_str(), &v6) == 1) {
        auto* sa = reinterpret_cast<struct sockaddr_in6*>(&addr);
        sa->sin6_family = AF_INET6;
        sa->sin6_port = htons(port);
        sa->sin6_addr = v6;
        addr_len = sizeof(struct sockaddr_in6);
        family = AF_INET6;
    } else {
        return common::Result<int>::err(ErrorCode::BindFailed, "Invalid bind address: " + literal);
    }

    int fd = socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return common::Result<int>::err(ErrorCode::BindFailed,
            "Failed to create socket for " + endpoint(literal, port) + ": " + std::strerror(errno));
    }

    auto fail = [fd, &literal, port](const char* what) {
        int err = errno;
        close(fd);
        ErrorCode code = (err == EACCES || err == EPERM) ? ErrorCode::PermissionDenied : ErrorCode::BindFailed;
        return common::Result<int>::err(code,
            std::string(what) + " " + endpoint(literal, port) + ": " + std::strerror(err));
    };

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return fail("Failed to set SO_REUSEADDR on");
    }
    if (family == AF_INET6 && setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &opt, sizeof(opt)) < 0) {
        return fail("Failed to set IPV6_V6ONLY on");
    }
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len) < 0) {
        return fail("Failed to bind to");
    }
    if (listen(fd, PosixFtpEngine::LISTEN_BACKLOG) < 0) {
        return fail("Failed to listen on");
    }
    return common::Result<int>::ok(fd);
}

// ============================================================================
// Control Session
// ============================================================================

class ControlSession {
public:
    ControlSession(InstanceState& state, TcpSocket& socket, common::CancellationToken token)
        : state_(state), socket_(socket), token_(std::move(token)) {}

    void run() {
        const std::string peer = socket_.peer_name();
        state_.logger->info("[Engine] Client connected from " + peer);

        if (!reply(220, PosixFtpEngine::GREETING)) return;

        std::string buffer;
        uint8_t chunk[512];

        while (true) {
            if (token_.is_cancellation_requested()) {
                reply(421, "Service shutting down");
                break;
            }

            SocketError ready = socket_.wait_readable(PosixFtpEngine::POLL_INTERVAL_MS);
            if (ready == SocketError::Timeout) continue;
            if (ready != SocketError::Ok) break;

            auto [n, err] = socket_.recv(chunk, sizeof(chunk));
            if (err == SocketError::WouldBlock) continue;
            if (err != SocketError::Ok) break;

            buffer.append(reinterpret_cast<const char*>(chunk), n);

            bool open = true;
            size_t pos;
            while (open && (pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                open = handle_line(line);
            }
            if (!open) break;

            if (buffer.size() > PosixFtpEngine::MAX_LINE_LENGTH) {
                reply(500, "Line too long");
                break;
            }
        }

        state_.logger->debug("[Engine] Client disconnected: " + peer);
    }

private:
    bool reply(int code, const std::string& text) {
        return socket_.send_all(std::to_string(code) + " " + text + "\r\n") == SocketError::Ok;
    }

    // Returns false when the connection should close
    bool handle_line(const std::string& line) {
        size_t space = line.find(' ');
        std::string verb = line.substr(0, space);
        std::string arg = (space == std::string::npos) ? "" : line.substr(space + 1);
        std::transform(verb.begin(), verb.end(), verb.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (verb != "PASS") {
            state_.logger->debug("[Engine] <- " + line);
        }

        if (verb == "QUIT") {
            reply(221, "Goodbye");
            return false;
        }
        if (verb == "USER") {
            pending_user_ = arg;
            logged_in_ = false;
            return reply(331, "Password required for " + arg);
        }
        if (verb == "PASS") {
            if (pending_user_.empty()) {
                return reply(503, "Login with USER first");
            }
            if (pending_user_ == state_.config.username() && arg == state_.config.password()) {
                logged_in_ = true;
                state_.logger->info("[Engine] User " + pending_user_ + " logged in");
                return reply(230, "User logged in");
            }
            state_.logger->warn("[Engine] Failed login for user " + pending_user_);
            pending_user_.clear();
            return reply(530, "Login incorrect");
        }
        if (verb == "NOOP") {
            return reply(200, "NOOP ok");
        }
        if (verb == "SYST") {
            return reply(215, "UNIX Type: L8");
        }
        if (!logged_in_) {
            return reply(530, "Please login with USER and PASS");
        }
        return reply(502, "Command not implemented");
    }

    InstanceState& state_;
    TcpSocket& socket_;
    common::CancellationToken token_;
    std::string pending_user_;
    bool logged_in_ = false;
};

void run_session(std::shared_ptr<InstanceState> state, int fd) {
    {
        TcpSocket socket(fd);
        socket.set_no_delay(true);

        ControlSession session(*state, socket, state->cancel_source.get_token());
        session.run();

        std::lock_guard<std::mutex> lock(state->mutex);
        state->clients.erase(fd);
    } // Socket closed here, before the session is counted out

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->active_sessions;
    }
    state->finished.notify_all();
}

void start_session(const std::shared_ptr<InstanceState>& state, int fd) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->clients.insert(fd);
        ++state->active_sessions;
    }

    try {
        std::thread(&run_session, state, fd).detach();
    } catch (const std::system_error& e) {
        state->logger->error(std::string("[Engine] Cannot spawn session thread: ") + e.what());
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->clients.erase(fd);
            --state->active_sessions;
        }
        close(fd);
        state->finished.notify_all();
    }
}

// ============================================================================
// Accept Loop
// ============================================================================

void accept_loop(std::shared_ptr<InstanceState> state) {
    auto token = state->cancel_source.get_token();

    std::vector<struct pollfd> pfds;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        for (const auto& l : state->listeners) {
            struct pollfd pfd;
            pfd.fd = l.fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            pfds.push_back(pfd);
        }
    }

    std::string failure;
    while (failure.empty() && !token.is_cancellation_requested()) {
        for (auto& p : pfds) p.revents = 0;

        int rc = poll(pfds.data(), pfds.size(), PosixFtpEngine::POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            failure = std::string("poll() failed: ") + std::strerror(errno);
            break;
        }
        if (rc == 0) continue;

        for (auto& p : pfds) {
            if (token.is_cancellation_requested()) break;

            if (p.revents & POLLIN) {
                int client = accept4(p.fd, nullptr, nullptr, SOCK_CLOEXEC);
                if (client >= 0) {
                    start_session(state, client);
                    continue;
                }
                if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
                if (errno == EMFILE || errno == ENFILE) {
                    state->logger->warn(std::string("[Engine] accept(): ") + std::strerror(errno));
                    std::this_thread::sleep_for(std::chrono::milliseconds(PosixFtpEngine::POLL_INTERVAL_MS));
                    continue;
                }
                failure = std::string("accept() failed: ") + std::strerror(errno);
                break;
            }
            if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                failure = "Listening socket closed unexpectedly";
                break;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        for (const auto& l : state->listeners) {
            close(l.fd);
        }
        state->listeners.clear();
        state->accept_exited = true;
    }
    state->finished.notify_all();

    // A teardown requested by the owner is not a failure
    if (!failure.empty() && !token.is_cancellation_requested()) {
        state->logger->error("[Engine] " + failure);
        if (state->on_failure) {
            state->on_failure(common::AppError{ErrorCode::EngineError, failure, ""});
        }
    } else {
        state->logger->debug("[Engine] Accept loop finished");
    }
}

// ============================================================================
// Service Handle
// ============================================================================

class PosixServiceHandle final : public interfaces::IServiceHandle {
public:
    PosixServiceHandle(
        std::shared_ptr<InstanceState> state,
        std::thread accept_thread,
        std::vector<std::string> bound
    ) : state_(std::move(state)),
        accept_thread_(std::move(accept_thread)),
        bound_(std::move(bound)) {}

    ~PosixServiceHandle() override {
        cancel();
        if (!await_completion(std::chrono::milliseconds(0)) && !force_terminate()) {
            // Stuck: the thread keeps its own reference to the state
            if (accept_thread_.joinable()) accept_thread_.detach();
        }
    }

    void cancel() override {
        if (state_->cancel_source.is_cancelled()) return;
        state_->logger->debug("[Engine] Cancellation requested");
        state_->cancel_source.cancel();
    }

    bool await_completion(std::chrono::milliseconds timeout) override {
        bool done = false;
        {
            std::unique_lock<std::mutex> lock(state_->mutex);
            done = state_->finished.wait_for(lock, timeout, [this] {
                return state_->completed_locked();
            });
        }
        if (done && accept_thread_.joinable()) {
            accept_thread_.join();
        }
        return done;
    }

    bool force_terminate() override {
        cancel();
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            for (const auto& l : state_->listeners) {
                shutdown(l.fd, SHUT_RDWR);
            }
            for (int fd : state_->clients) {
                shutdown(fd, SHUT_RDWR);
            }
        }
        return await_completion(FORCE_CONFIRM_TIMEOUT);
    }

    std::vector<std::string> bound_addresses() const override {
        return bound_;
    }

private:
    std::shared_ptr<InstanceState> state_;
    std::thread accept_thread_;
    std::vector<std::string> bound_;
};

} // namespace

// ============================================================================
// PosixFtpEngine
// ============================================================================

PosixFtpEngine::PosixFtpEngine(std::shared_ptr<interfaces::ILogger> logger)
    : logger_(std::move(logger)) {}

std::shared_ptr<interfaces::IStorageBackend> PosixFtpEngine::make_storage(const std::string& directory) {
    return std::make_shared<LocalStorageBackend>(directory);
}

common::Result<std::unique_ptr<interfaces::IServiceHandle>> PosixFtpEngine::create_server(
    const core::CanonicalConfig& config,
    std::shared_ptr<interfaces::IStorageBackend> storage,
    interfaces::EngineFailureCallback on_failure
) {
    using HandleResult = common::Result<std::unique_ptr<interfaces::IServiceHandle>>;

    if (!storage) {
        return HandleResult::err(ErrorCode::EngineError, "No storage backend");
    }
    auto access = storage->check_access();
    if (access.is_err()) return access.error();

    std::vector<std::string> targets;
    if (config.is_wildcard_bind()) {
        targets = {"0.0.0.0", "::"};
    } else {
        targets = {config.bind_address()};
    }

    std::vector<Listener> listeners;
    std::optional<common::AppError> first_error;

    for (const auto& target : targets) {
        auto res = bind_listener(target, config.port());
        if (res.is_ok()) {
            listeners.push_back(Listener{res.unwrap(), target});
            logger_->info("[Engine] Listening on " + endpoint(target, config.port()));
            continue;
        }
        if (targets.size() > 1) {
            logger_->warn("[Engine] " + res.error().message);
        }
        if (!first_error || res.error().code == ErrorCode::PermissionDenied) {
            first_error = res.error();
        }
    }

    if (listeners.empty()) {
        return *first_error;
    }

    auto state = std::make_shared<InstanceState>(config, storage, logger_, std::move(on_failure));
    std::vector<std::string> bound;
    for (const auto& l : listeners) bound.push_back(l.address);
    state->listeners = std::move(listeners);

    std::thread accept_thread;
    try {
        accept_thread = std::thread(&accept_loop, state);
    } catch (const std::system_error& e) {
        for (const auto& l : state->listeners) close(l.fd);
        state->listeners.clear();
        return HandleResult::err(ErrorCode::EngineError,
            std::string("Cannot spawn accept thread: ") + e.what());
    }

    core::PortRange range = config.pasv_range();
    logger_->info("[Engine] Serving " + storage->root() + " (passive ports " +
                  std::to_string(range.start) + "-" + std::to_string(range.end) + ")");

    return HandleResult::ok(std::make_unique<PosixServiceHandle>(state, std::move(accept_thread), bound));
}

} // namespace linux_os
} // namespace platform
} // namespace sixftp
