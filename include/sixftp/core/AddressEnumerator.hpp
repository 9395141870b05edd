#pragma once
#include <string>
#include <vector>

namespace sixftp {
namespace core {

    enum class AddressFamily {
        IPv4,
        IPv6
    };

    enum class AddressScope {
        Loopback,
        LinkLocal,
        Private,    // RFC1918 IPv4, fc00::/7 unique-local IPv6
        Public,     // Global unicast
        Temporary   // Global IPv6 privacy-extension address
    };

    struct InterfaceAddress {
        AddressFamily family;
        std::string address;   // Literal, no brackets
        AddressScope scope;
        std::string interface_name;

        bool operator==(const InterfaceAddress& o) const {
            return family == o.family && address == o.address;
        }
    };

    const char* to_string(AddressScope scope);

    // ========================================================================
    // AddressEnumerator
    // ========================================================================
    // Snapshot of the host's usable addresses. Queried fresh every call.
    // Always includes 127.0.0.1 and ::1. Skips interfaces that are down,
    // link-local addresses, and IPv6 addresses that are neither global
    // unicast nor unique-local. A failing adapter entry is skipped.
    // ========================================================================
    class AddressEnumerator {
    public:
        virtual ~AddressEnumerator() = default;

        virtual std::vector<InterfaceAddress> list_addresses() const;

        // Classify a literal. Returns false when the literal does not parse.
        static bool classify(const std::string& literal, InterfaceAddress& out);

        // Whether list_addresses() would report this address
        static bool is_reportable(const InterfaceAddress& addr);
    };

} // namespace core
} // namespace sixftp
