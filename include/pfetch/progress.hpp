#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pfetch {

enum class TaskState {
    Pending,
    Running,
    Completed,
    Failed,
    Interrupted,
};

[[nodiscard]] bool isTerminal(TaskState state);
std::string_view toString(TaskState state);

// floor(downloaded * 100 / total) clamped to [0, 100]; empty when the total
// is unknown or zero.
[[nodiscard]] std::optional<int> computePercent(std::uint64_t downloaded,
                                                std::optional<std::uint64_t> total);

struct Progress {
    std::string id;
    std::string url;
    std::string destination;
    TaskState state{TaskState::Pending};
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    std::optional<int> percent;
    std::string error_message;
};

} // namespace pfetch
