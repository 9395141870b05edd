#pragma once
#include <optional>
#include <string>
#include <vector>
#include "sixftp/common/Result.hpp"
#include "sixftp/core/CanonicalConfig.hpp"

namespace sixftp {
namespace core {

    enum class RunMode {
        Interactive,  // no arguments: console form
        Unattended,   // arguments: run to completion
        Help,
        Version
    };

    struct ModeSelection {
        RunMode mode = RunMode::Interactive;
        std::optional<CanonicalConfig> config; // Unattended only
    };

    class ModeSelector {
    public:
        // 'args' excludes the program name. A help/version flag wins over any
        // other argument unless it is the value of an option; otherwise every
        // token goes through ConfigNormalizer.
        static common::Result<ModeSelection> select_mode(const std::vector<std::string>& args);

        static std::string usage(const std::string& program);
        static std::string version_line();
    };

} // namespace core
} // namespace sixftp
