#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace sixftp {
namespace core {

    // Defaults applied by the normalizer to absent fields only
    constexpr const char* DEFAULT_DIRECTORY = ".";
    constexpr const char* DEFAULT_USERNAME = "user";
    constexpr const char* DEFAULT_PASSWORD = "password";
    constexpr uint16_t DEFAULT_PORT = 9000;
    constexpr uint16_t DEFAULT_PASV_START = 30000;
    constexpr uint16_t DEFAULT_PASV_END = 30100;
    constexpr const char* DEFAULT_BIND = "0.0.0.0";

    constexpr uint16_t MAX_PASV_PORTS = 100;

    struct PortRange {
        uint16_t start = 0;
        uint16_t end = 0;

        bool contains(uint16_t port) const { return port >= start && port <= end; }
        bool operator==(const PortRange& o) const { return start == o.start && end == o.end; }
        bool operator!=(const PortRange& o) const { return !(*this == o); }
    };

    // Validated, immutable server configuration. Only the ConfigNormalizer
    // should build one from operator input.
    class CanonicalConfig {
    public:
        CanonicalConfig(std::string directory,
                        std::string username,
                        std::string password,
                        uint16_t port,
                        PortRange pasv_range,
                        std::string bind_address)
            : directory_(std::move(directory)),
              username_(std::move(username)),
              password_(std::move(password)),
              port_(port),
              pasv_range_(pasv_range),
              bind_address_(std::move(bind_address)) {}

        const std::string& directory() const { return directory_; }
        const std::string& username() const { return username_; }
        const std::string& password() const { return password_; }
        uint16_t port() const { return port_; }
        PortRange pasv_range() const { return pasv_range_; }
        const std::string& bind_address() const { return bind_address_; }

        // 0.0.0.0 or ::
        bool is_wildcard_bind() const;
        bool is_ipv6_bind() const;

        bool operator==(const CanonicalConfig& o) const;
        bool operator!=(const CanonicalConfig& o) const { return !(*this == o); }

    private:
        std::string directory_;
        std::string username_;
        std::string password_;
        uint16_t port_;
        PortRange pasv_range_;
        std::string bind_address_;
    };

} // namespace core
} // namespace sixftp
