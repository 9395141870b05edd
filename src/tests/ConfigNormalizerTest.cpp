// ============================================================================
// ConfigNormalizer Test Program
// ============================================================================
// Argument parsing, form-field validation, defaults, error fields and
// re-normalization of canonical configs.
//
// Run with: ./ConfigNormalizerTest
// ============================================================================

#include "TestHarness.hpp"
#include "sixftp/core/ConfigNormalizer.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace sixftp;
using namespace sixftp::core;
namespace fs = std::filesystem;

namespace {

// Expects an InvalidArgument error on 'field_name'
template <typename T>
bool rejected(const common::Result<T>& res, const std::string& field_name, std::string& details) {
    if (res.is_ok()) {
        details = "accepted";
        return false;
    }
    details = common::describe(res.error());
    return res.error().code == common::ErrorCode::InvalidArgument && res.error().field == field_name;
}

fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("sixftp_" + name + "_" + std::to_string(getpid()));
    fs::create_directories(dir);
    return dir;
}

} // namespace

void test_argument_scenarios() {
    print_section("Argument Scenarios");

    {
        auto res = ConfigNormalizer::normalize_arguments(
            {"-p", "21212", "--pasv-range", "40000-40010", "-b", "127.0.0.1"});
        bool ok = res.is_ok();
        if (ok) {
            const auto& c = res.unwrap();
            ok = c.port() == 21212 &&
                 c.pasv_range() == PortRange{40000, 40010} &&
                 c.bind_address() == "127.0.0.1" &&
                 c.directory() == "." &&
                 c.username() == "user" &&
                 c.password() == "password";
        }
        log_test("normalize_arguments(port, pasv-range, bind)", ok,
                 res.is_err() ? res.error().message : "");
    }

    {
        auto res = ConfigNormalizer::normalize_arguments({"--pasv-range", "100-50"});
        std::string details;
        bool ok = rejected(res, "pasv-range", details) && res.error().message == "start>end";
        log_test("normalize_arguments(pasv-range 100-50)", ok, details);
    }

    {
        auto res = ConfigNormalizer::normalize_arguments({});
        bool ok = res.is_ok();
        if (ok) {
            const auto& c = res.unwrap();
            ok = c.port() == DEFAULT_PORT &&
                 c.pasv_range() == PortRange{DEFAULT_PASV_START, DEFAULT_PASV_END} &&
                 c.bind_address() == DEFAULT_BIND &&
                 c.is_wildcard_bind();
        }
        log_test("normalize_arguments(no arguments) -> defaults", ok);
    }

    {
        auto res = ConfigNormalizer::normalize_arguments(
            {"--port=2121", "--username=alice", "--password=", "--bind=::1"});
        bool ok = res.is_ok() &&
                  res.unwrap().port() == 2121 &&
                  res.unwrap().username() == "alice" &&
                  res.unwrap().password().empty() &&
                  res.unwrap().is_ipv6_bind();
        log_test("normalize_arguments(--opt=value)", ok,
                 res.is_err() ? res.error().message : "");
    }

    {
        auto res = ConfigNormalizer::normalize_arguments({"-p", "2121", "-p", "2122"});
        bool ok = res.is_ok() && res.unwrap().port() == 2122;
        log_test("normalize_arguments(repeated option, last wins)", ok);
    }

    {
        auto res = ConfigNormalizer::parse_arguments({"--frobnicate", "1"});
        std::string details;
        bool ok = rejected(res, "--frobnicate", details);
        log_test("parse_arguments(unknown option)", ok, details);
    }

    {
        auto res = ConfigNormalizer::parse_arguments({"-p"});
        std::string details;
        bool ok = rejected(res, "port", details);
        log_test("parse_arguments(missing value)", ok, details);
    }

    {
        auto res = ConfigNormalizer::parse_arguments({"stray"});
        std::string details;
        bool ok = rejected(res, "stray", details);
        log_test("parse_arguments(positional token)", ok, details);
    }
}

void test_field_validation() {
    print_section("Field Validation");

    struct Case {
        const char* name;
        const char* field_name;
        const char* value;
    };

    const Case cases[] = {
        {"port 0", "port", "0"},
        {"port 70000", "port", "70000"},
        {"port 123456", "port", "123456"},
        {"port abc", "port", "abc"},
        {"port -1", "port", "-1"},
        {"port empty", "port", ""},
        {"pasv-range without dash", "pasv-range", "30000"},
        {"pasv-range two dashes", "pasv-range", "1-2-3"},
        {"pasv-range start 0", "pasv-range", "0-10"},
        {"pasv-range too large", "pasv-range", "30000-30101"},
        {"bind hostname", "bind", "example.com"},
        {"bind garbage", "bind", "300.1.1.1"},
        {"username empty", "username", ""},
        {"directory empty", "directory", ""},
        {"directory missing", "directory", "/nonexistent/sixftp/dir"},
    };

    for (const auto& c : cases) {
        FieldMap fields = default_fields();
        fields[c.field_name] = c.value;
        auto res = ConfigNormalizer::normalize(fields);
        std::string details;
        bool ok = rejected(res, c.field_name, details);
        log_test(std::string("normalize rejects ") + c.name, ok, details);
    }

    {
        FieldMap fields = default_fields();
        fields["colour"] = "blue";
        auto res = ConfigNormalizer::normalize(fields);
        std::string details;
        log_test("normalize rejects unknown field", rejected(res, "colour", details), details);
    }

    {
        FieldMap fields = default_fields();
        fields[field::PASV_RANGE] = "30000-30100";
        fields[field::PASSWORD] = "";
        auto res = ConfigNormalizer::normalize(fields);
        log_test("normalize accepts 100-port range and empty password", res.is_ok(),
                 res.is_err() ? res.error().message : "");
    }

    {
        FieldMap fields = default_fields();
        fields[field::PASV_RANGE] = "40000-40000";
        auto res = ConfigNormalizer::normalize(fields);
        log_test("normalize accepts single-port range", res.is_ok());
    }

    {
        auto bracketed = ConfigNormalizer::parse_bind_address("[::1]");
        auto star = ConfigNormalizer::parse_bind_address("*");
        auto spaced = ConfigNormalizer::parse_bind_address(" 10.0.0.1 ");
        bool ok = bracketed.is_ok() && bracketed.unwrap() == "::1" &&
                  star.is_ok() && star.unwrap() == "0.0.0.0" &&
                  spaced.is_ok() && spaced.unwrap() == "10.0.0.1";
        log_test("parse_bind_address(brackets, *, whitespace)", ok);
    }

    {
        fs::path dir = make_temp_dir("normalizer");
        fs::path file = dir / "plain.txt";
        std::ofstream(file) << "not a directory";

        FieldMap fields = default_fields();
        fields[field::DIRECTORY] = file.string();
        auto res = ConfigNormalizer::normalize(fields);
        std::string details;
        bool file_rejected = rejected(res, "directory", details);

        fields[field::DIRECTORY] = dir.string();
        auto accepted = ConfigNormalizer::normalize(fields);

        log_test("normalize rejects a regular file as directory", file_rejected, details);
        log_test("normalize accepts an existing directory", accepted.is_ok() &&
                 accepted.unwrap().directory() == dir.string());

        std::error_code ec;
        fs::remove_all(dir, ec);
    }
}

void test_renormalization() {
    print_section("Re-normalization");

    auto source_config = ConfigNormalizer::normalize_arguments(
        {"-u", "bob", "--password", "s3cret", "-p", "2121", "--pasv-range", "50000-50050", "-b", "::"});
    if (source_config.is_err()) {
        log_test("normalize_arguments(source config)", false, source_config.error().message);
        return;
    }
    const CanonicalConfig& config = source_config.unwrap();

    auto from_fields = ConfigNormalizer::normalize(ConfigNormalizer::to_fields(config));
    log_test("normalize(to_fields(c)) == c", from_fields.is_ok() && from_fields.unwrap() == config);

    auto from_args = ConfigNormalizer::normalize_arguments(ConfigNormalizer::to_arguments(config));
    log_test("normalize_arguments(to_arguments(c)) == c", from_args.is_ok() && from_args.unwrap() == config);

    log_test("wildcard IPv6 bind detected", config.is_wildcard_bind() && config.is_ipv6_bind());
}

void test_warnings() {
    print_section("Warnings");

    auto inside = ConfigNormalizer::normalize_arguments({"-p", "30005", "--pasv-range", "30000-30010"});
    auto outside = ConfigNormalizer::normalize_arguments({"-p", "2121", "--pasv-range", "30000-30010"});

    bool ok = inside.is_ok() && outside.is_ok();
    if (ok) {
        auto w = ConfigNormalizer::warnings(inside.unwrap());
        ok = w.size() == 1 && w[0].find("30005") != std::string::npos &&
             ConfigNormalizer::warnings(outside.unwrap()).empty();
    }
    log_test("warnings(listen port inside passive range)", ok);
}

int main() {
    std::cout << "ConfigNormalizer Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    test_argument_scenarios();
    test_field_validation();
    test_renormalization();
    test_warnings();

    return print_summary();
}
