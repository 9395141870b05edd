#pragma once
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "sixftp/core/AddressEnumerator.hpp"
#include "sixftp/core/ConfigNormalizer.hpp"
#include "sixftp/core/ControlPlane.hpp"

namespace sixftp {
namespace frontend {

// ============================================================================
// InteractiveShell - console form over the ControlPlane
// ============================================================================
// The form is a field map edited with "set"; "start" submits it. The loop
// polls the input descriptor so queued log events are printed while the
// operator is idle. Nothing here waits on the service except the final
// graceful stop on quit/EOF.
// ============================================================================

class InteractiveShell {
public:
    InteractiveShell(
        core::ControlPlane& plane,
        std::shared_ptr<core::AddressEnumerator> enumerator,
        std::ostream& out
    );
    ~InteractiveShell();

    InteractiveShell(const InteractiveShell&) = delete;
    InteractiveShell& operator=(const InteractiveShell&) = delete;

    // Runs until quit, end of input, or a readable signalfd (SIGINT/SIGTERM
    // taken like quit). Returns the process exit code.
    int run(int input_fd, int signal_fd = -1);

    // signalfd for SIGINT/SIGTERM, which must already be blocked. -1 on error.
    static int open_termination_fd();

    // Executes one command line. Returns false when the shell should exit.
    bool handle_line(const std::string& line);

    // Prints queued log events
    void drain_events();

    // Stops a running server and waits for it (quit/EOF path)
    void shutdown();

    const core::FieldMap& fields() const { return fields_; }

    // Events below the threshold are dropped
    void set_threshold(interfaces::LogLevel threshold) { threshold_ = threshold; }

    static constexpr int POLL_INTERVAL_MS = 100;
    static constexpr int SHUTDOWN_TIMEOUT_MS = 10000;

private:
    using Handler = std::function<bool(const std::string& args)>;

    struct Command {
        std::string name;
        std::string usage;
        Handler handler;
    };

    void register_commands();
    void prompt();

    bool cmd_show(const std::string& args);
    bool cmd_set(const std::string& args);
    bool cmd_reset(const std::string& args);
    bool cmd_start(const std::string& args);
    bool cmd_stop(const std::string& args);
    bool cmd_status(const std::string& args);
    bool cmd_addresses(const std::string& args);
    bool cmd_help(const std::string& args);

    core::ControlPlane& plane_;
    std::shared_ptr<core::AddressEnumerator> enumerator_;
    std::ostream& out_;

    core::FieldMap fields_;
    std::vector<Command> commands_;
    std::unordered_map<std::string, size_t> command_index_;

    std::mutex events_mutex_;
    std::deque<core::LogEvent> events_;
    uint32_t subscription_ = 0;
    interfaces::LogLevel threshold_ = interfaces::LogLevel::Info;
};

} // namespace frontend
} // namespace sixftp
