#include "sixftp/core/ModeSelector.hpp"
#include "sixftp/core/ConfigNormalizer.hpp"
#include "sixftp/core/Version.hpp"
#include <sstream>

namespace sixftp {
namespace core {

common::Result<ModeSelection> ModeSelector::select_mode(const std::vector<std::string>& args) {
    ModeSelection selection;

    if (args.empty()) {
        selection.mode = RunMode::Interactive;
        return selection;
    }

    // Walk the tokens the way parse_arguments() does: a token consumed as
    // an option's value is never a flag ("--password -h" sets a password)
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (token == "-h" || token == "--help") {
            selection.mode = RunMode::Help;
            return selection;
        }
        if (token == "-V" || token == "--version") {
            selection.mode = RunMode::Version;
            return selection;
        }
        bool inline_value = token.rfind("--", 0) == 0 && token.find('=') != std::string::npos;
        if (!inline_value && token.size() > 1 && token[0] == '-') {
            ++i; // Every option takes a value
        }
    }

    auto config = ConfigNormalizer::normalize_arguments(args);
    if (config.is_err()) return config.error();

    selection.mode = RunMode::Unattended;
    selection.config = config.unwrap();
    return selection;
}

std::string ModeSelector::usage(const std::string& program) {
    std::ostringstream ss;
    ss << PROGRAM_ABOUT << "\n\n"
       << "Usage: " << program << " [OPTIONS]\n"
       << "       " << program << "            (no options: interactive mode)\n\n"
       << "Options:\n"
       << "  -d, --directory <DIRECTORY>   Directory to serve via FTP [default: " << DEFAULT_DIRECTORY << "]\n"
       << "  -u, --username <USERNAME>     FTP username [default: " << DEFAULT_USERNAME << "]\n"
       << "      --password <PASSWORD>     FTP password [default: " << DEFAULT_PASSWORD << "]\n"
       << "  -p, --port <PORT>             Main FTP port [default: " << DEFAULT_PORT << "]\n"
       << "      --pasv-range <START-END>  Passive port range [default: "
       << DEFAULT_PASV_START << "-" << DEFAULT_PASV_END << "]\n"
       << "  -b, --bind <BIND>             Bind address [default: " << DEFAULT_BIND << "]\n"
       << "  -h, --help                    Print help\n"
       << "  -V, --version                 Print version\n\n"
       << "Environment:\n"
       << "  SIXFTP_LOG                    Log level: error, warn, info (default), debug\n";
    return ss.str();
}

std::string ModeSelector::version_line() {
    return std::string(PROGRAM_NAME) + " " + PROGRAM_VERSION;
}

} // namespace core
} // namespace sixftp
