#include "pfetch/cli.hpp"
#include "pfetch/console_controller.hpp"
#include "pfetch/detail/curl_utils.hpp"
#include "pfetch/detail/size_format.hpp"
#include "pfetch/download_supervisor.hpp"
#include "pfetch/log.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::atomic<bool> g_interrupt_requested{false};

void onInterruptSignal(int) {
    g_interrupt_requested.store(true);
}

void printSummary(const pfetch::DownloadSupervisor& supervisor) {
    for (const auto& progress : supervisor.snapshots()) {
        if (progress.state == pfetch::TaskState::Failed) {
            std::cerr << "Failed: " << progress.url << " - " << progress.error_message << std::endl;
        } else if (progress.state == pfetch::TaskState::Interrupted) {
            std::cerr << "Interrupted: " << progress.url << " after "
                      << pfetch::detail::formatBytes(progress.downloaded_bytes) << std::endl;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    pfetch::CliOptions options;
    try {
        options = pfetch::parseCommandLine(argc, argv);
    } catch (const pfetch::CliError& ex) {
        std::cerr << ex.what() << "\n" << pfetch::usage(argv[0]);
        return 1;
    }

    if (options.show_help) {
        std::cout << pfetch::usage(argv[0]);
        return 0;
    }

    try {
        pfetch::log::init(options.log_level, options.log_file);
        pfetch::detail::ensureCurlInitialized();

        std::signal(SIGINT, onInterruptSignal);
        std::signal(SIGTERM, onInterruptSignal);

        pfetch::DownloadSupervisor supervisor(options.supervisor);
        for (const auto& url : options.urls) {
            supervisor.add(url);
        }
        supervisor.startAll();

        pfetch::ConsoleController controller(supervisor, std::cout);
        const auto summary = controller.run(g_interrupt_requested);

        printSummary(supervisor);
        return (summary.failed == 0 && summary.interrupted == 0) ? 0 : 2;
    } catch (const std::exception& ex) {
        pfetch::log::get()->critical("Fatal error: {}", ex.what());
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
