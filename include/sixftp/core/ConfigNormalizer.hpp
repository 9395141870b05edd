#pragma once
#include <map>
#include <string>
#include <vector>
#include "sixftp/common/Result.hpp"
#include "sixftp/core/CanonicalConfig.hpp"

namespace sixftp {
namespace core {

// ============================================================================
// ConfigNormalizer
// ============================================================================
// Turns raw operator input into a CanonicalConfig. Two input shapes:
//   - argument tokens:  "-p 2121 --pasv-range=40000-40010 ..."
//   - form fields:      {"port": "2121", "pasv-range": "40000-40010", ...}
// Both end in the same field map, so validation lives in one place.
//
// Field names: directory, username, password, port, pasv-range, bind.
// Absent fields take the defaults from CanonicalConfig.hpp. A field that is
// present but empty is validated as given (an empty password is allowed, an
// empty port is not).
// ============================================================================

using FieldMap = std::map<std::string, std::string>;

namespace field {
    constexpr const char* DIRECTORY = "directory";
    constexpr const char* USERNAME = "username";
    constexpr const char* PASSWORD = "password";
    constexpr const char* PORT = "port";
    constexpr const char* PASV_RANGE = "pasv-range";
    constexpr const char* BIND = "bind";
}

// Field map holding every default, in form order
FieldMap default_fields();

class ConfigNormalizer {
public:
    // Validate a field map. Unknown field names are rejected.
    static common::Result<CanonicalConfig> normalize(const FieldMap& fields);

    // Parse option tokens (no program name) into a field map. Help and
    // version flags are not handled here; see ModeSelector.
    static common::Result<FieldMap> parse_arguments(const std::vector<std::string>& args);

    static common::Result<CanonicalConfig> normalize_arguments(const std::vector<std::string>& args);

    // Argument tokens that normalize back to the same config
    static std::vector<std::string> to_arguments(const CanonicalConfig& config);
    static FieldMap to_fields(const CanonicalConfig& config);

    // Non-fatal configuration problems (listen port inside the passive range)
    static std::vector<std::string> warnings(const CanonicalConfig& config);

    // Helpers shared with the form front-end
    static common::Result<uint16_t> parse_port(const std::string& text, const std::string& field_name);
    static common::Result<PortRange> parse_port_range(const std::string& text);
    static common::Result<std::string> parse_bind_address(const std::string& text);
};

} // namespace core
} // namespace sixftp
