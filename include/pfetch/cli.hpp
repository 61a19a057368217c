#pragma once

#include "download_supervisor.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace pfetch {

class CliError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    SupervisorOptions supervisor;
    std::vector<std::string> urls;
    spdlog::level::level_enum log_level{spdlog::level::warn};
    std::string log_file;
    bool show_help{false};
};

// Throws CliError on unknown options, missing or malformed values, or when
// no URL is given (unless help was requested).
CliOptions parseCommandLine(int argc, const char* const* argv);

std::string usage(const std::string& program_name);

} // namespace pfetch
