#include "pfetch/progress.hpp"

#include <algorithm>

namespace pfetch {

bool isTerminal(TaskState state) {
    return state == TaskState::Completed || state == TaskState::Failed ||
           state == TaskState::Interrupted;
}

std::string_view toString(TaskState state) {
    switch (state) {
    case TaskState::Pending:
        return "pending";
    case TaskState::Running:
        return "running";
    case TaskState::Completed:
        return "completed";
    case TaskState::Failed:
        return "failed";
    case TaskState::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

std::optional<int> computePercent(std::uint64_t downloaded, std::optional<std::uint64_t> total) {
    if (!total || *total == 0) {
        return std::nullopt;
    }
    // Avoid overflowing downloaded * 100 on very large transfers.
    const std::uint64_t percent = downloaded >= *total
        ? 100
        : (downloaded > UINT64_MAX / 100 ? downloaded / (*total / 100) : downloaded * 100 / *total);
    return static_cast<int>(std::min<std::uint64_t>(percent, 100));
}

} // namespace pfetch
