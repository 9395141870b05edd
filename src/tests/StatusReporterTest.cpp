// ============================================================================
// StatusReporter / AddressEnumerator Test Program
// ============================================================================
// Address classification, connection summary formatting and the log
// event relay.
//
// Run with: ./StatusReporterTest
// ============================================================================

#include "TestHarness.hpp"
#include "sixftp/core/AddressEnumerator.hpp"
#include "sixftp/core/StatusReporter.hpp"

#include <algorithm>

using namespace sixftp;
using namespace sixftp::core;

namespace {

CanonicalConfig make_config(const std::string& bind) {
    return CanonicalConfig(".", "user", "pw", 2121, PortRange{40000, 40010}, bind);
}

bool contains_line(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

size_t index_of(const std::vector<std::string>& lines, const std::string& line) {
    return static_cast<size_t>(std::find(lines.begin(), lines.end(), line) - lines.begin());
}

} // namespace

void test_classification() {
    print_section("Address Classification");

    struct Case {
        const char* literal;
        AddressFamily family;
        AddressScope scope;
    };

    const Case cases[] = {
        {"127.0.0.1", AddressFamily::IPv4, AddressScope::Loopback},
        {"10.1.2.3", AddressFamily::IPv4, AddressScope::Private},
        {"172.16.0.1", AddressFamily::IPv4, AddressScope::Private},
        {"192.168.1.20", AddressFamily::IPv4, AddressScope::Private},
        {"169.254.10.10", AddressFamily::IPv4, AddressScope::LinkLocal},
        {"8.8.8.8", AddressFamily::IPv4, AddressScope::Public},
        {"::1", AddressFamily::IPv6, AddressScope::Loopback},
        {"fe80::1", AddressFamily::IPv6, AddressScope::LinkLocal},
        {"fd12:3456::1", AddressFamily::IPv6, AddressScope::Private},
        {"2001:db8::1", AddressFamily::IPv6, AddressScope::Public},
        {"2001:db8::200:0:0:1", AddressFamily::IPv6, AddressScope::Temporary},
        {"ff02::1", AddressFamily::IPv6, AddressScope::LinkLocal},
    };

    for (const auto& c : cases) {
        InterfaceAddress addr;
        bool parsed = AddressEnumerator::classify(c.literal, addr);
        bool ok = parsed && addr.family == c.family && addr.scope == c.scope;
        log_test(std::string("classify(") + c.literal + ")", ok,
                 parsed ? to_string(addr.scope) : "not parsed");
    }

    InterfaceAddress addr;
    log_test("classify(hostname) fails", !AddressEnumerator::classify("localhost", addr));
}

void test_enumeration() {
    print_section("Enumeration");

    AddressEnumerator enumerator;
    auto addrs = enumerator.list_addresses();

    InterfaceAddress v4_loopback{AddressFamily::IPv4, "127.0.0.1", AddressScope::Loopback, ""};
    InterfaceAddress v6_loopback{AddressFamily::IPv6, "::1", AddressScope::Loopback, ""};
    bool loopbacks = std::find(addrs.begin(), addrs.end(), v4_loopback) != addrs.end() &&
                     std::find(addrs.begin(), addrs.end(), v6_loopback) != addrs.end();
    log_test("list_addresses() includes both loopbacks", loopbacks,
             std::to_string(addrs.size()) + " address(es)");

    bool reportable = std::all_of(addrs.begin(), addrs.end(), AddressEnumerator::is_reportable);
    log_test("list_addresses() skips link-local", reportable);

    bool unique = true;
    for (size_t i = 0; i < addrs.size(); ++i) {
        for (size_t j = i + 1; j < addrs.size(); ++j) {
            if (addrs[i] == addrs[j]) unique = false;
        }
    }
    log_test("list_addresses() has no duplicates", unique);
}

void test_describe() {
    print_section("Connection Summary");

    std::vector<InterfaceAddress> addrs = {
        {AddressFamily::IPv6, "2001:db8::1", AddressScope::Public, "eth0"},
        {AddressFamily::IPv4, "192.168.1.20", AddressScope::Private, "eth0"},
        {AddressFamily::IPv6, "::1", AddressScope::Loopback, "lo"},
        {AddressFamily::IPv4, "127.0.0.1", AddressScope::Loopback, "lo"},
        {AddressFamily::IPv6, "fd00::5", AddressScope::Private, "eth0"},
    };

    {
        auto lines = StatusReporter::describe(make_config("0.0.0.0"), addrs);
        bool urls = contains_line(lines, "   - ftp://user:pw@127.0.0.1:2121") &&
                    contains_line(lines, "   - ftp://user:pw@192.168.1.20:2121") &&
                    contains_line(lines, "   - ftp://user:pw@[2001:db8::1]:2121 (public)") &&
                    contains_line(lines, "   - ftp://user:pw@[fd00::5]:2121 (private)") &&
                    contains_line(lines, "   - ftp://user:pw@[::1]:2121");
        log_test("describe(wildcard) lists every address", urls);

        bool ordered = index_of(lines, "   - ftp://user:pw@127.0.0.1:2121") <
                       index_of(lines, "   - ftp://user:pw@192.168.1.20:2121") &&
                       index_of(lines, "   - ftp://user:pw@192.168.1.20:2121") <
                       index_of(lines, "   - ftp://user:pw@[2001:db8::1]:2121 (public)") &&
                       index_of(lines, "   - ftp://user:pw@[2001:db8::1]:2121 (public)") <
                       index_of(lines, "   - ftp://user:pw@[::1]:2121");
        log_test("describe() orders IPv4 first, then by literal", ordered);

        bool details = contains_line(lines, "Serving directory: .") &&
                       contains_line(lines, "Username: user") &&
                       contains_line(lines, "Password: pw") &&
                       contains_line(lines, "Passive ports: 40000 to 40010") &&
                       lines.front() == "SixFTP Server Started";
        log_test("describe() prints directory, credentials and passive range", details);

        std::vector<InterfaceAddress> shuffled(addrs.rbegin(), addrs.rend());
        log_test("describe() is independent of input order",
                 StatusReporter::describe(make_config("0.0.0.0"), shuffled) == lines);
    }

    {
        auto lines = StatusReporter::describe(make_config("192.168.1.20"), addrs);
        bool only_bind = contains_line(lines, "   - ftp://user:pw@192.168.1.20:2121") &&
                         !contains_line(lines, "   - ftp://user:pw@127.0.0.1:2121");
        log_test("describe(specific bind) lists only the bind address", only_bind);
    }

    {
        auto lines = StatusReporter::describe(make_config("::1"), addrs);
        log_test("describe(IPv6 bind) brackets the host",
                 contains_line(lines, "   - ftp://user:pw@[::1]:2121"));
    }

    {
        auto lines = StatusReporter::describe(make_config("0.0.0.0"), addrs, {"0.0.0.0", "::"});
        size_t last_url = index_of(lines, "   - ftp://user:pw@[fd00::5]:2121 (private)");
        size_t bound = index_of(lines, "Successfully bound to:");
        size_t serving = index_of(lines, "Serving directory: .");
        bool ok = last_url < bound && bound < serving &&
                  lines[bound + 1] == "   - ftp://user:pw@0.0.0.0:2121" &&
                  lines[bound + 2] == "   - ftp://user:pw@[::]:2121" &&
                  lines[bound + 3].empty();
        log_test("describe(bound) places bindings between addresses and directory", ok);

        log_test("describe(no bindings) omits the block",
                 !contains_line(StatusReporter::describe(make_config("0.0.0.0"), addrs, {}),
                                "Successfully bound to:"));
    }

    {
        auto lines = StatusReporter::describe_bindings(make_config("0.0.0.0"), {"0.0.0.0", "::"});
        bool ok = lines.size() == 3 && lines[0] == "Successfully bound to:" &&
                  lines[1] == "   - ftp://user:pw@0.0.0.0:2121" &&
                  lines[2] == "   - ftp://user:pw@[::]:2121";
        log_test("describe_bindings()", ok);
    }
}

void test_relay() {
    print_section("Event Relay");

    auto reporter = std::make_shared<StatusReporter>();
    std::vector<std::string> first;
    std::vector<std::string> second;

    uint32_t a = reporter->subscribe([&first](const LogEvent& e) { first.push_back(e.message); });
    uint32_t b = reporter->subscribe([&second](const LogEvent& e) { second.push_back(e.source + ":" + e.message); });

    RelayLogger logger(reporter, "Engine");
    logger.info("one");
    logger.warn("two");
    reporter->unsubscribe(a);
    logger.error("three");

    bool ok = a != b &&
              first == std::vector<std::string>{"one", "two"} &&
              second == std::vector<std::string>{"Engine:one", "Engine:two", "Engine:three"};
    log_test("relay() preserves order and honours unsubscribe", ok);

    reporter->unsubscribe(b);
    logger.info("four");
    log_test("relay() with no subscribers", second.size() == 3);
}

int main() {
    std::cout << "StatusReporter Test Suite" << std::endl;
    std::cout << "=========================" << std::endl;

    test_classification();
    test_enumeration();
    test_describe();
    test_relay();

    return print_summary();
}
