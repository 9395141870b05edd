#include "sixftp/core/AddressEnumerator.hpp"
#include "sixftp/core/ConsoleLogger.hpp"
#include "sixftp/core/ControlPlane.hpp"
#include "sixftp/core/LifecycleController.hpp"
#include "sixftp/core/ModeSelector.hpp"
#include "sixftp/core/StatusReporter.hpp"
#include "sixftp/core/Version.hpp"
#include "frontend/InteractiveShell.hpp"
#include "frontend/UnattendedRunner.hpp"
#include "platform/linux/PosixFtpEngine.hpp"

#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace sixftp;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // The mode is decided before anything else is built
    auto selected = core::ModeSelector::select_mode(args);
    if (selected.is_err()) {
        std::cerr << "Error: " << common::describe(selected.error()) << std::endl;
        std::cerr << "Try '" << core::PROGRAM_NAME << " --help' for more information." << std::endl;
        return 2;
    }
    const core::ModeSelection& selection = selected.unwrap();

    switch (selection.mode) {
        case core::RunMode::Help:
            std::cout << core::ModeSelector::usage(argc > 0 ? argv[0] : core::PROGRAM_NAME);
            return 0;
        case core::RunMode::Version:
            std::cout << core::ModeSelector::version_line() << std::endl;
            return 0;
        default:
            break;
    }

    // Both front-ends take SIGINT/SIGTERM synchronously; block them before
    // any thread exists so every thread inherits the mask
    auto blocked = frontend::UnattendedRunner::block_termination_signals();
    if (blocked.is_err()) {
        std::cerr << "Error: " << blocked.error().message << std::endl;
        return 1;
    }

    try {
        auto threshold = core::ConsoleLogger::threshold_from_env();
        auto console = std::make_shared<core::ConsoleLogger>(threshold);
        auto reporter = std::make_shared<core::StatusReporter>();
        auto enumerator = std::make_shared<core::AddressEnumerator>();

        auto engine = std::make_shared<platform::linux_os::PosixFtpEngine>(
            std::make_shared<core::RelayLogger>(reporter, "Engine"));
        core::LifecycleController controller(
            engine, std::make_shared<core::RelayLogger>(reporter, "Lifecycle"));

        if (selection.mode == core::RunMode::Unattended) {
            frontend::UnattendedRunner runner(controller, reporter, enumerator, console, std::cout, std::cerr);
            return runner.run(*selection.config);
        }

        core::ControlPlane plane(controller, reporter, enumerator);
        frontend::InteractiveShell shell(plane, enumerator, std::cout);
        shell.set_threshold(threshold);

        int signal_fd = frontend::InteractiveShell::open_termination_fd();
        if (signal_fd < 0) {
            console->warn("[Main] signalfd unavailable, Ctrl+C will not stop the server gracefully");
            auto restored = frontend::UnattendedRunner::unblock_termination_signals();
            if (restored.is_err()) console->warn("[Main] " + restored.error().message);
        }
        int code = shell.run(STDIN_FILENO, signal_fd);
        if (signal_fd >= 0) close(signal_fd);
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
