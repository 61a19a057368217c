#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pfetch::log {

inline constexpr const char kLoggerName[] = "pfetch";

// Replaces the "pfetch" logger with a colored stderr sink and, when
// log_file is non-empty, a plain file sink.
void init(spdlog::level::level_enum level, const std::string& log_file = {});

// Returns the "pfetch" logger, creating a default stderr one on first use.
std::shared_ptr<spdlog::logger> get();

// Throws std::invalid_argument for names spdlog does not know.
spdlog::level::level_enum parseLevel(const std::string& name);

} // namespace pfetch::log
