#include "InteractiveShell.hpp"
#include "sixftp/core/ModeSelector.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

// POSIX headers
#include <poll.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace sixftp {
namespace frontend {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

const char* FIELD_ORDER[] = {
    core::field::DIRECTORY,
    core::field::USERNAME,
    core::field::PASSWORD,
    core::field::PORT,
    core::field::PASV_RANGE,
    core::field::BIND,
};

} // namespace

InteractiveShell::InteractiveShell(
    core::ControlPlane& plane,
    std::shared_ptr<core::AddressEnumerator> enumerator,
    std::ostream& out
) : plane_(plane),
    enumerator_(std::move(enumerator)),
    out_(out),
    fields_(core::default_fields()) {
    register_commands();

    // Relay callbacks run on service threads: queue and return
    subscription_ = plane_.subscribe_log_events([this](const core::LogEvent& event) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.push_back(event);
    });
}

InteractiveShell::~InteractiveShell() {
    plane_.unsubscribe_log_events(subscription_);
}

void InteractiveShell::register_commands() {
    commands_ = {
        {"show", "show                  Show the form", [this](const std::string& a) { return cmd_show(a); }},
        {"set", "set <field> <value>   Edit a form field", [this](const std::string& a) { return cmd_set(a); }},
        {"reset", "reset                 Restore the defaults", [this](const std::string& a) { return cmd_reset(a); }},
        {"start", "start                 Start the server with the form", [this](const std::string& a) { return cmd_start(a); }},
        {"stop", "stop                  Stop the server", [this](const std::string& a) { return cmd_stop(a); }},
        {"status", "status                Show the server state", [this](const std::string& a) { return cmd_status(a); }},
        {"addresses", "addresses             List network addresses", [this](const std::string& a) { return cmd_addresses(a); }},
        {"help", "help                  Show this help", [this](const std::string& a) { return cmd_help(a); }},
        {"quit", "quit                  Stop the server and exit", [](const std::string&) { return false; }},
    };

    for (size_t i = 0; i < commands_.size(); ++i) {
        command_index_[commands_[i].name] = i;
    }
    command_index_["exit"] = command_index_["quit"];
}

// ============================================================================
// Event Loop
// ============================================================================

int InteractiveShell::open_termination_fd() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return signalfd(-1, &set, SFD_CLOEXEC);
}

int InteractiveShell::run(int input_fd, int signal_fd) {
    out_ << core::ModeSelector::version_line() << " - interactive mode" << std::endl;
    out_ << "Type 'help' for commands." << std::endl;
    prompt();

    std::string pending;
    char buffer[1024];
    bool running = true;

    struct pollfd pfds[2];
    pfds[0].fd = input_fd;
    pfds[0].events = POLLIN;
    pfds[1].fd = signal_fd;
    pfds[1].events = POLLIN;
    nfds_t nfds = signal_fd >= 0 ? 2 : 1;

    while (running) {
        pfds[0].revents = 0;
        pfds[1].revents = 0;

        int rc = poll(pfds, nfds, POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            out_ << "Input error: " << std::strerror(errno) << std::endl;
            break;
        }

        if (rc == 0) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            if (events_.empty()) continue;
        }

        if (nfds == 2 && (pfds[1].revents & POLLIN)) {
            struct signalfd_siginfo info;
            if (read(signal_fd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                out_ << std::endl << "Interrupted (" << (info.ssi_signo == SIGINT ? "SIGINT" : "SIGTERM")
                     << "), shutting down" << std::endl;
                break;
            }
        }

        if (pfds[0].revents & (POLLERR | POLLNVAL)) {
            out_ << "Input closed" << std::endl;
            break;
        }

        if (pfds[0].revents & (POLLIN | POLLHUP)) {
            ssize_t n = read(input_fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                out_ << "Input error: " << std::strerror(errno) << std::endl;
                break;
            }
            if (n == 0) {
                out_ << std::endl;
                break; // EOF
            }
            pending.append(buffer, static_cast<size_t>(n));

            size_t pos;
            while (running && (pos = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                running = handle_line(line);
            }
        }

        drain_events();
        if (running) prompt();
    }

    shutdown();
    return 0;
}

void InteractiveShell::prompt() {
    out_ << "sixftp> " << std::flush;
}

void InteractiveShell::drain_events() {
    std::deque<core::LogEvent> events;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events.swap(events_);
    }

    for (const auto& event : events) {
        if (event.level < threshold_) continue;
        out_ << "[" << interfaces::to_string(event.level) << "] " << event.message << std::endl;
    }
}

void InteractiveShell::shutdown() {
    auto phase = plane_.query_state().phase;
    if (phase != core::ServicePhase::Stopped) {
        auto res = plane_.request_stop();
        if (res.is_err()) {
            out_ << "Stop failed: " << res.error().message << std::endl;
        }
    }

    if (!plane_.wait_for_pending_stop(std::chrono::milliseconds(SHUTDOWN_TIMEOUT_MS))) {
        out_ << "Server did not stop in time" << std::endl;
    }
    drain_events();
}

bool InteractiveShell::handle_line(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) return true;

    size_t space = text.find_first_of(" \t");
    std::string name = text.substr(0, space);
    std::string args = (space == std::string::npos) ? "" : trim(text.substr(space));

    auto it = command_index_.find(name);
    if (it == command_index_.end()) {
        out_ << "Unknown command '" << name << "'. Type 'help' for commands." << std::endl;
        return true;
    }
    return commands_[it->second].handler(args);
}

// ============================================================================
// Commands
// ============================================================================

bool InteractiveShell::cmd_show(const std::string&) {
    for (const char* name : FIELD_ORDER) {
        auto it = fields_.find(name);
        out_ << "  " << std::left << std::setw(12) << name << "= "
             << (it != fields_.end() ? it->second : "") << std::endl;
    }
    return true;
}

bool InteractiveShell::cmd_set(const std::string& args) {
    size_t space = args.find_first_of(" \t");
    std::string name = args.substr(0, space);
    std::string value = (space == std::string::npos) ? "" : trim(args.substr(space));

    if (name.empty()) {
        out_ << "Usage: set <field> <value>" << std::endl;
        return true;
    }
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        out_ << "Unknown field '" << name << "'. Fields: directory, username, password, "
             << "port, pasv-range, bind" << std::endl;
        return true;
    }
    it->second = value;
    out_ << "  " << name << " = " << value << std::endl;
    return true;
}

bool InteractiveShell::cmd_reset(const std::string&) {
    fields_ = core::default_fields();
    out_ << "Form reset to defaults" << std::endl;
    return true;
}

bool InteractiveShell::cmd_start(const std::string&) {
    // Errors come back through the relay as well
    auto res = plane_.submit_config(fields_);
    drain_events();
    if (res.is_err()) return true;

    for (const auto& line : plane_.connection_summary()) {
        out_ << line << std::endl;
    }
    return true;
}

bool InteractiveShell::cmd_stop(const std::string&) {
    auto res = plane_.request_stop();
    if (res.is_err()) {
        out_ << "Stop failed: " << res.error().message << std::endl;
    } else if (!res.unwrap().pending) {
        if (plane_.query_state().phase == core::ServicePhase::Stopped) {
            out_ << "Server is not running" << std::endl;
        } else {
            out_ << "Stop already in progress" << std::endl;
        }
    }
    return true;
}

bool InteractiveShell::cmd_status(const std::string&) {
    auto state = plane_.query_state();
    out_ << "Server: " << core::to_string(state.phase);
    if (state.phase == core::ServicePhase::Failed && !state.failure_reason.empty()) {
        out_ << " (" << state.failure_reason << ")";
    }
    out_ << std::endl;
    return true;
}

bool InteractiveShell::cmd_addresses(const std::string&) {
    for (const auto& addr : enumerator_->list_addresses()) {
        out_ << "  " << (addr.family == core::AddressFamily::IPv4 ? "IPv4 " : "IPv6 ")
             << addr.address << " (" << core::to_string(addr.scope);
        if (!addr.interface_name.empty()) out_ << ", " << addr.interface_name;
        out_ << ")" << std::endl;
    }
    return true;
}

bool InteractiveShell::cmd_help(const std::string&) {
    out_ << "Commands:" << std::endl;
    for (const auto& cmd : commands_) {
        out_ << "  " << cmd.usage << std::endl;
    }
    return true;
}

} // namespace frontend
} // namespace sixftp
