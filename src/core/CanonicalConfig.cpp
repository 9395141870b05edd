#include "sixftp/core/CanonicalConfig.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>

namespace sixftp {
namespace core {

    bool CanonicalConfig::is_wildcard_bind() const {
        in_addr v4{};
        if (inet_pton(AF_INET, bind_address_.c_str(), &v4) == 1) {
            return v4.s_addr == htonl(INADDR_ANY);
        }
        in6_addr v6{};
        if (inet_pton(AF_INET6, bind_address_.c_str(), &v6) == 1) {
            return IN6_IS_ADDR_UNSPECIFIED(&v6);
        }
        return false;
    }

    bool CanonicalConfig::is_ipv6_bind() const {
        in6_addr v6{};
        return inet_pton(AF_INET6, bind_address_.c_str(), &v6) == 1;
    }

    bool CanonicalConfig::operator==(const CanonicalConfig& o) const {
        return directory_ == o.directory_ &&
               username_ == o.username_ &&
               password_ == o.password_ &&
               port_ == o.port_ &&
               pasv_range_ == o.pasv_range_ &&
               bind_address_ == o.bind_address_;
    }

} // namespace core
} // namespace sixftp
