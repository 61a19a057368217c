#include "pfetch/detail/size_format.hpp"

#include <array>

#include <fmt/format.h>

namespace pfetch::detail {

std::string formatBytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 4> kUnits{"KB", "MB", "GB", "TB"};
    constexpr std::uint64_t kStep = 1024;

    if (bytes < kStep) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / kStep;
    std::size_t unit = 0;
    while (value >= kStep && unit + 1 < kUnits.size()) {
        value /= kStep;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace pfetch::detail
