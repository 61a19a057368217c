#include "pfetch/cli.hpp"
#include "pfetch/log.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace pfetch {

namespace {

long parseNumber(const std::string& option, const std::string& text, long min, long max) {
    long value = 0;
    try {
        std::size_t consumed = 0;
        value = std::stol(text, &consumed);
        if (consumed != text.size()) {
            throw CliError(fmt::format("Invalid value for {}: {}", option, text));
        }
    } catch (const std::logic_error&) {
        throw CliError(fmt::format("Invalid value for {}: {}", option, text));
    }

    if (value < min || value > max) {
        throw CliError(fmt::format("Value for {} must be between {} and {}", option, min, max));
    }
    return value;
}

} // namespace

CliOptions parseCommandLine(int argc, const char* const* argv) {
    CliOptions options;
    int arg_index = 1;

    auto requireValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw CliError("Missing value for " + option);
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            options.show_help = true;
            return options;
        } else if (option == "-d") {
            options.supervisor.download_directory = requireValue(option);
        } else if (option == "-c") {
            options.supervisor.max_concurrent = static_cast<std::size_t>(parseNumber(option, requireValue(option), 0, 1024));
        } else if (option == "--connect-timeout") {
            options.supervisor.engine.connect_timeout = std::chrono::seconds{parseNumber(option, requireValue(option), 1, 3600)};
        } else if (option == "--stall-timeout") {
            options.supervisor.engine.low_speed_time = std::chrono::seconds{parseNumber(option, requireValue(option), 1, 3600)};
        } else if (option == "--timeout") {
            options.supervisor.engine.total_timeout = std::chrono::seconds{parseNumber(option, requireValue(option), 0, 86400)};
        } else if (option == "--log-level") {
            const std::string level = requireValue(option);
            try {
                options.log_level = log::parseLevel(level);
            } catch (const std::invalid_argument& ex) {
                throw CliError(ex.what());
            }
        } else if (option == "--log-file") {
            options.log_file = requireValue(option);
        } else {
            throw CliError("Unknown option: " + option);
        }
    }

    for (; arg_index < argc; ++arg_index) {
        options.urls.emplace_back(argv[arg_index]);
    }

    if (options.urls.empty()) {
        throw CliError("No URL given");
    }

    return options;
}

std::string usage(const std::string& program_name) {
    return fmt::format(
        "Usage: {} [options] <url> [<url> ...]\n"
        "Options:\n"
        "  -d <directory>           Download directory (default: current directory)\n"
        "  -c <count>               Maximum simultaneous downloads, 0 = unlimited (default: 0)\n"
        "  --connect-timeout <s>    Connection timeout in seconds (default: 30)\n"
        "  --stall-timeout <s>      Abort when no data arrives for this long (default: 60)\n"
        "  --timeout <s>            Limit for a whole download, 0 = none (default: 0)\n"
        "  --log-level <level>      trace, debug, info, warn, error, critical or off (default: warn)\n"
        "  --log-file <path>        Also write the log to this file\n"
        "  -h, --help               Show this message\n",
        program_name);
}

} // namespace pfetch
