#pragma once

#include <cstdint>
#include <string>

namespace pfetch::detail {

// "<n> B" below 1 KiB, otherwise one decimal in the largest binary unit
// that keeps the value at or above 1 ("1.5 KB", "3.0 GB").
std::string formatBytes(std::uint64_t bytes);

} // namespace pfetch::detail
