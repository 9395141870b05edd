#include "sixftp/core/AddressEnumerator.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace sixftp {
namespace core {

namespace {

    AddressScope classify_v4(const in_addr& addr) {
        uint32_t ip = ntohl(addr.s_addr);
        uint8_t a = static_cast<uint8_t>(ip >> 24);
        uint8_t b = static_cast<uint8_t>(ip >> 16);

        if (a == 127) return AddressScope::Loopback;
        if (a == 169 && b == 254) return AddressScope::LinkLocal;
        if (a == 10) return AddressScope::Private;
        if (a == 172 && b >= 16 && b <= 31) return AddressScope::Private;
        if (a == 192 && b == 168) return AddressScope::Private;
        return AddressScope::Public;
    }

    AddressScope classify_v6(const in6_addr& addr) {
        const uint8_t* b = addr.s6_addr;
        uint16_t first = static_cast<uint16_t>((b[0] << 8) | b[1]);

        if (IN6_IS_ADDR_LOOPBACK(&addr)) return AddressScope::Loopback;
        if (first >= 0xFE80 && first <= 0xFEBF) return AddressScope::LinkLocal;
        if (first >= 0xFC00 && first <= 0xFDFF) return AddressScope::Private;
        if (first >= 0x2000 && first <= 0x3FFF) {
            // Interface identifier is the low 64 bits; the universal/local
            // bit is 0x02 of its first byte. Privacy addresses set it.
            bool universal_local = (b[8] & 0x02) != 0;
            return universal_local ? AddressScope::Temporary : AddressScope::Public;
        }
        // Unspecified, multicast, mapped, documentation... not reportable
        return AddressScope::LinkLocal;
    }

    void push_unique(std::vector<InterfaceAddress>& list, const InterfaceAddress& addr) {
        if (std::find(list.begin(), list.end(), addr) == list.end()) {
            list.push_back(addr);
        }
    }

} // namespace

const char* to_string(AddressScope scope) {
    switch (scope) {
        case AddressScope::Loopback:  return "loopback";
        case AddressScope::LinkLocal: return "link-local";
        case AddressScope::Private:   return "private";
        case AddressScope::Public:    return "public";
        case AddressScope::Temporary: return "temporary";
    }
    return "unknown";
}

bool AddressEnumerator::classify(const std::string& literal, InterfaceAddress& out) {
    in_addr v4{};
    if (inet_pton(AF_INET, literal.c_str(), &v4) == 1) {
        out.family = AddressFamily::IPv4;
        out.address = literal;
        out.scope = classify_v4(v4);
        return true;
    }
    in6_addr v6{};
    if (inet_pton(AF_INET6, literal.c_str(), &v6) == 1) {
        out.family = AddressFamily::IPv6;
        out.address = literal;
        out.scope = classify_v6(v6);
        return true;
    }
    return false;
}

bool AddressEnumerator::is_reportable(const InterfaceAddress& addr) {
    return addr.scope != AddressScope::LinkLocal;
}

std::vector<InterfaceAddress> AddressEnumerator::list_addresses() const {
    std::vector<InterfaceAddress> result;
    result.push_back({AddressFamily::IPv4, "127.0.0.1", AddressScope::Loopback, "lo"});
    result.push_back({AddressFamily::IPv6, "::1", AddressScope::Loopback, "lo"});

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        int family = ifa->ifa_addr->sa_family;
        char ip_str[INET6_ADDRSTRLEN];
        InterfaceAddress addr;
        addr.interface_name = ifa->ifa_name ? ifa->ifa_name : "";

        if (family == AF_INET) {
            auto* sa = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
            if (!inet_ntop(AF_INET, &sa->sin_addr, ip_str, sizeof(ip_str))) continue;
            addr.family = AddressFamily::IPv4;
            addr.scope = classify_v4(sa->sin_addr);
        } else if (family == AF_INET6) {
            auto* sa = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            if (!inet_ntop(AF_INET6, &sa->sin6_addr, ip_str, sizeof(ip_str))) continue;
            addr.family = AddressFamily::IPv6;
            addr.scope = classify_v6(sa->sin6_addr);
        } else {
            continue;
        }

        addr.address = ip_str;
        if (is_reportable(addr)) {
            push_unique(result, addr);
        }
    }

    freeifaddrs(ifaddr);
    return result;
}

} // namespace core
} // namespace sixftp
