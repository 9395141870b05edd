#include "sixftp/core/StatusReporter.hpp"
#include <algorithm>

namespace sixftp {
namespace core {

namespace {

    bool address_order(const InterfaceAddress& a, const InterfaceAddress& b) {
        if (a.family != b.family) return a.family == AddressFamily::IPv4;
        return a.address < b.address;
    }

    std::string host_part(const std::string& literal) {
        if (literal.find(':') != std::string::npos) return "[" + literal + "]";
        return literal;
    }

    std::string scope_suffix(const InterfaceAddress& addr) {
        if (addr.family != AddressFamily::IPv6) return "";
        switch (addr.scope) {
            case AddressScope::Public:    return " (public)";
            case AddressScope::Temporary: return " (temporary)";
            case AddressScope::Private:   return " (private)";
            default:                      return "";
        }
    }

} // namespace

StatusReporter::StatusReporter() = default;
StatusReporter::~StatusReporter() = default;

// ============================================================================
// Formatting
// ============================================================================

std::string StatusReporter::connection_url(const CanonicalConfig& config, const std::string& host) {
    return "ftp://" + config.username() + ":" + config.password() + "@" +
           host_part(host) + ":" + std::to_string(config.port());
}

std::vector<InterfaceAddress> StatusReporter::reachable(
    const CanonicalConfig& config,
    const std::vector<InterfaceAddress>& addresses
) {
    std::vector<InterfaceAddress> out;

    if (config.is_wildcard_bind()) {
        out = addresses;
    } else {
        InterfaceAddress bind_addr;
        if (AddressEnumerator::classify(config.bind_address(), bind_addr)) {
            out.push_back(bind_addr);
        }
    }

    std::sort(out.begin(), out.end(), address_order);
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<std::string> StatusReporter::describe(
    const CanonicalConfig& config,
    const std::vector<InterfaceAddress>& addresses
) {
    return describe(config, addresses, {});
}

std::vector<std::string> StatusReporter::describe(
    const CanonicalConfig& config,
    const std::vector<InterfaceAddress>& addresses,
    const std::vector<std::string>& bound
) {
    std::vector<std::string> lines;
    lines.push_back("SixFTP Server Started");
    lines.push_back("==========================");
    lines.push_back("");

    auto hosts = reachable(config, addresses);
    if (!hosts.empty()) {
        lines.push_back("Available network addresses:");
        for (const auto& addr : hosts) {
            lines.push_back("   - " + connection_url(config, addr.address) + scope_suffix(addr));
        }
        lines.push_back("");
    }

    if (!bound.empty()) {
        for (auto& line : describe_bindings(config, bound)) {
            lines.push_back(std::move(line));
        }
        lines.push_back("");
    }

    PortRange range = config.pasv_range();
    lines.push_back("Serving directory: " + config.directory());
    lines.push_back("Username: " + config.username());
    lines.push_back("Password: " + config.password());
    lines.push_back("Passive ports: " + std::to_string(range.start) + " to " + std::to_string(range.end));
    lines.push_back("Make sure to forward the main and passive port range in your firewall/router if needed.");
    lines.push_back("");
    lines.push_back("Connect using any FTP client with the displayed addresses");
    return lines;
}

std::vector<std::string> StatusReporter::describe_bindings(
    const CanonicalConfig& config,
    const std::vector<std::string>& bound
) {
    std::vector<std::string> lines;
    lines.push_back("Successfully bound to:");
    for (const auto& addr : bound) {
        lines.push_back("   - " + connection_url(config, addr));
    }
    return lines;
}

// ============================================================================
// Event Relay
// ============================================================================

void StatusReporter::relay(const LogEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sub : subscribers_) {
        sub.callback(event);
    }
}

uint32_t StatusReporter::subscribe(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t id = next_id_++;
    subscribers_.push_back(Subscriber{id, std::move(callback)});
    return id;
}

void StatusReporter::unsubscribe(uint32_t subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(subscribers_.begin(), subscribers_.end(),
        [subscriber_id](const Subscriber& s) { return s.id == subscriber_id; });
    subscribers_.erase(it, subscribers_.end());
}

} // namespace core
} // namespace sixftp
