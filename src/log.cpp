#include "pfetch/log.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pfetch::log {

namespace {

constexpr const char kPattern[] = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> makeLogger(spdlog::level::level_enum level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kPattern);
    sinks.push_back(console);

    if (!log_file.empty()) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void init(spdlog::level::level_enum level, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(registryMutex());
    spdlog::drop(kLoggerName);
    spdlog::register_logger(makeLogger(level, log_file));
}

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    auto logger = makeLogger(spdlog::level::warn, {});
    spdlog::register_logger(logger);
    return logger;
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off", so only accept "off" when asked for.
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

} // namespace pfetch::log
