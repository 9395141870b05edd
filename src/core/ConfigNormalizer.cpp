#include "sixftp/core/ConfigNormalizer.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace sixftp {
namespace core {

namespace fs = std::filesystem;

namespace {

    using common::ErrorCode;

    template <typename T>
    common::Result<T> invalid(const std::string& field_name, const std::string& reason) {
        return common::Result<T>::err(ErrorCode::InvalidArgument, reason, field_name);
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    struct OptionSpec {
        const char* short_name; // may be nullptr
        const char* long_name;
        const char* field_name;
    };

    const OptionSpec OPTIONS[] = {
        {"-d", "--directory", field::DIRECTORY},
        {"-u", "--username", field::USERNAME},
        {nullptr, "--password", field::PASSWORD},
        {"-p", "--port", field::PORT},
        {nullptr, "--pasv-range", field::PASV_RANGE},
        {"-b", "--bind", field::BIND},
    };

    const OptionSpec* find_option(const std::string& token) {
        for (const auto& opt : OPTIONS) {
            if (token == opt.long_name) return &opt;
            if (opt.short_name && token == opt.short_name) return &opt;
        }
        return nullptr;
    }

    bool is_known_field(const std::string& name) {
        for (const auto& opt : OPTIONS) {
            if (name == opt.field_name) return true;
        }
        return false;
    }

    std::string value_or_default(const FieldMap& fields, const char* name, const std::string& fallback) {
        auto it = fields.find(name);
        return it != fields.end() ? it->second : fallback;
    }

    common::EmptyResult check_directory(const std::string& directory) {
        if (directory.empty()) {
            return common::EmptyResult::err(ErrorCode::InvalidArgument, "must not be empty", field::DIRECTORY);
        }

        std::error_code ec;
        if (!fs::exists(directory, ec)) {
            return common::EmptyResult::err(ErrorCode::InvalidArgument,
                "'" + directory + "' does not exist", field::DIRECTORY);
        }
        if (!fs::is_directory(directory, ec)) {
            return common::EmptyResult::err(ErrorCode::InvalidArgument,
                "'" + directory + "' is not a directory", field::DIRECTORY);
        }
        if (access(directory.c_str(), R_OK | X_OK) != 0) {
            return common::EmptyResult::err(ErrorCode::InvalidArgument,
                "'" + directory + "' is not readable", field::DIRECTORY);
        }
        return common::EmptyResult::success();
    }

} // namespace

FieldMap default_fields() {
    return {
        {field::DIRECTORY, DEFAULT_DIRECTORY},
        {field::USERNAME, DEFAULT_USERNAME},
        {field::PASSWORD, DEFAULT_PASSWORD},
        {field::PORT, std::to_string(DEFAULT_PORT)},
        {field::PASV_RANGE, std::to_string(DEFAULT_PASV_START) + "-" + std::to_string(DEFAULT_PASV_END)},
        {field::BIND, DEFAULT_BIND},
    };
}

// ============================================================================
// Field Parsers
// ============================================================================

common::Result<uint16_t> ConfigNormalizer::parse_port(const std::string& text, const std::string& field_name) {
    std::string value = trim(text);
    if (value.empty()) {
        return invalid<uint16_t>(field_name, "must not be empty");
    }
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        return invalid<uint16_t>(field_name, "'" + value + "' is not a number");
    }
    if (value.size() > 5) {
        return invalid<uint16_t>(field_name, "'" + value + "' is out of range (max 65535)");
    }

    unsigned long port = std::stoul(value);
    if (port == 0) {
        return invalid<uint16_t>(field_name, "must be greater than 0");
    }
    if (port > 65535) {
        return invalid<uint16_t>(field_name, "'" + value + "' is out of range (max 65535)");
    }
    return common::Result<uint16_t>::ok(static_cast<uint16_t>(port));
}

common::Result<PortRange> ConfigNormalizer::parse_port_range(const std::string& text) {
    std::string value = trim(text);
    size_t dash = value.find('-');
    if (dash == std::string::npos || value.find('-', dash + 1) != std::string::npos) {
        return invalid<PortRange>(field::PASV_RANGE, "expected start-end (e.g. 30000-30010)");
    }

    auto start = parse_port(value.substr(0, dash), field::PASV_RANGE);
    if (start.is_err()) return start.error();
    auto end = parse_port(value.substr(dash + 1), field::PASV_RANGE);
    if (end.is_err()) return end.error();

    PortRange range{start.unwrap(), end.unwrap()};
    if (range.start > range.end) {
        return invalid<PortRange>(field::PASV_RANGE, "start>end");
    }
    if (range.end - range.start > MAX_PASV_PORTS) {
        return invalid<PortRange>(field::PASV_RANGE,
            "range too large (max " + std::to_string(MAX_PASV_PORTS) + " ports)");
    }
    return common::Result<PortRange>::ok(range);
}

common::Result<std::string> ConfigNormalizer::parse_bind_address(const std::string& text) {
    std::string value = trim(text);

    // [::1] -> ::1
    if (!value.empty() && value.front() == '[') value.erase(0, 1);
    if (!value.empty() && value.back() == ']') value.pop_back();

    if (value == "*") {
        return common::Result<std::string>::ok(DEFAULT_BIND);
    }

    in_addr v4{};
    in6_addr v6{};
    if (inet_pton(AF_INET, value.c_str(), &v4) == 1 || inet_pton(AF_INET6, value.c_str(), &v6) == 1) {
        return common::Result<std::string>::ok(value);
    }
    return invalid<std::string>(field::BIND, "'" + value + "' is not an IP address");
}

// ============================================================================
// Normalization
// ============================================================================

common::Result<CanonicalConfig> ConfigNormalizer::normalize(const FieldMap& fields) {
    for (const auto& [name, value] : fields) {
        if (!is_known_field(name)) {
            return invalid<CanonicalConfig>(name, "unknown field");
        }
    }

    const FieldMap defaults = default_fields();

    std::string directory = value_or_default(fields, field::DIRECTORY, defaults.at(field::DIRECTORY));
    auto dir_check = check_directory(directory);
    if (dir_check.is_err()) return dir_check.error();

    std::string username = value_or_default(fields, field::USERNAME, defaults.at(field::USERNAME));
    if (username.empty()) {
        return invalid<CanonicalConfig>(field::USERNAME, "must not be empty");
    }

    std::string password = value_or_default(fields, field::PASSWORD, defaults.at(field::PASSWORD));

    auto port = parse_port(value_or_default(fields, field::PORT, defaults.at(field::PORT)), field::PORT);
    if (port.is_err()) return port.error();

    auto range = parse_port_range(value_or_default(fields, field::PASV_RANGE, defaults.at(field::PASV_RANGE)));
    if (range.is_err()) return range.error();

    auto bind = parse_bind_address(value_or_default(fields, field::BIND, defaults.at(field::BIND)));
    if (bind.is_err()) return bind.error();

    return CanonicalConfig(directory, username, password, port.unwrap(), range.unwrap(), bind.unwrap());
}

common::Result<FieldMap> ConfigNormalizer::parse_arguments(const std::vector<std::string>& args) {
    FieldMap fields;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string token = args[i];
        std::string value;
        bool has_inline_value = false;

        // --port=2121
        if (token.rfind("--", 0) == 0) {
            size_t eq = token.find('=');
            if (eq != std::string::npos) {
                value = token.substr(eq + 1);
                token = token.substr(0, eq);
                has_inline_value = true;
            }
        }

        const OptionSpec* opt = find_option(token);
        if (!opt) {
            return common::Result<FieldMap>::err(ErrorCode::InvalidArgument, "unknown argument", token);
        }

        if (!has_inline_value) {
            if (i + 1 >= args.size()) {
                return common::Result<FieldMap>::err(ErrorCode::InvalidArgument,
                    std::string("missing value for ") + opt->long_name, opt->field_name);
            }
            value = args[++i];
        }

        fields[opt->field_name] = value;
    }

    return common::Result<FieldMap>::ok(std::move(fields));
}

common::Result<CanonicalConfig> ConfigNormalizer::normalize_arguments(const std::vector<std::string>& args) {
    auto fields = parse_arguments(args);
    if (fields.is_err()) return fields.error();
    return normalize(fields.unwrap());
}

FieldMap ConfigNormalizer::to_fields(const CanonicalConfig& config) {
    PortRange range = config.pasv_range();
    return {
        {field::DIRECTORY, config.directory()},
        {field::USERNAME, config.username()},
        {field::PASSWORD, config.password()},
        {field::PORT, std::to_string(config.port())},
        {field::PASV_RANGE, std::to_string(range.start) + "-" + std::to_string(range.end)},
        {field::BIND, config.bind_address()},
    };
}

std::vector<std::string> ConfigNormalizer::to_arguments(const CanonicalConfig& config) {
    const FieldMap fields = to_fields(config);
    std::vector<std::string> args;
    for (const auto& opt : OPTIONS) {
        args.push_back(opt.long_name);
        args.push_back(fields.at(opt.field_name));
    }
    return args;
}

std::vector<std::string> ConfigNormalizer::warnings(const CanonicalConfig& config) {
    std::vector<std::string> out;
    PortRange range = config.pasv_range();
    if (range.contains(config.port())) {
        out.push_back("Listen port " + std::to_string(config.port()) +
                      " lies inside the passive port range " +
                      std::to_string(range.start) + "-" + std::to_string(range.end));
    }
    return out;
}

} // namespace core
} // namespace sixftp
