#include "pfetch/console_controller.hpp"
#include "pfetch/detail/size_format.hpp"
#include "pfetch/log.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace pfetch {

ConsoleController::ConsoleController(DownloadSupervisor& supervisor, std::ostream& out)
    : supervisor_(supervisor), out_(out) {
    loadRows();
}

void ConsoleController::loadRows() {
    order_.clear();
    rows_.clear();
    for (auto& progress : supervisor_.snapshots()) {
        order_.push_back(progress.id);
        rows_.emplace(progress.id, std::move(progress));
    }
}

DownloadSummary ConsoleController::run(const std::atomic<bool>& interrupt_requested) {
    bool cancel_sent = false;

    while (true) {
        if (!cancel_sent && interrupt_requested.load()) {
            cancel_sent = true;
            log::get()->info("Interrupt received, cancelling downloads");
            supervisor_.cancelAll();
        }

        // Block for the first event of a frame, then take whatever else is queued.
        if (auto event = supervisor_.events().waitPop(refresh_interval_)) {
            applyEvent(*event);
            for (const auto& queued : supervisor_.events().drain()) {
                applyEvent(queued);
            }
        }

        redrawPanel(buildProgressPanel());

        if (allFinished()) {
            break;
        }
    }

    out_ << std::flush;
    return summary();
}

bool ConsoleController::applyEvent(const DownloadEvent& event) {
    auto it = rows_.find(event.task_id);
    if (it == rows_.end()) {
        return false;
    }

    Progress& row = it->second;
    // The snapshot taken at construction may already be terminal while older
    // events for the task are still queued.
    if (isTerminal(row.state)) {
        return true;
    }

    std::visit(
        [&row](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, ProgressPayload>) {
                row.state = TaskState::Running;
                row.downloaded_bytes = payload.bytes_downloaded;
                row.total_bytes = payload.total_bytes;
                row.percent = payload.percent;
            } else if constexpr (std::is_same_v<T, CompletedPayload>) {
                row.state = TaskState::Completed;
                row.downloaded_bytes = payload.bytes_downloaded;
                if (!row.total_bytes) {
                    row.total_bytes = payload.bytes_downloaded;
                }
                row.percent = 100;
            } else if constexpr (std::is_same_v<T, ErrorPayload>) {
                row.state = TaskState::Failed;
                row.error_message = payload.message;
            } else {
                row.state = TaskState::Interrupted;
            }
        },
        event.payload);
    return true;
}

bool ConsoleController::allFinished() const {
    return std::all_of(rows_.begin(), rows_.end(),
                       [](const auto& entry) { return isTerminal(entry.second.state); });
}

DownloadSummary ConsoleController::summary() const {
    DownloadSummary result;
    for (const auto& entry : rows_) {
        switch (entry.second.state) {
        case TaskState::Completed:
            ++result.completed;
            break;
        case TaskState::Failed:
            ++result.failed;
            break;
        case TaskState::Interrupted:
            ++result.interrupted;
            break;
        default:
            break;
        }
    }
    return result;
}

std::vector<Progress> ConsoleController::rows() const {
    std::vector<Progress> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(rows_.at(id));
    }
    return out;
}

std::string ConsoleController::buildProgressPanel() const {
    std::string panel;
    panel.reserve(order_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("pfetch ({} downloads)\n", order_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    bool total_known = true;

    for (const auto& id : order_) {
        const auto& progress = rows_.at(id);
        panel += formatTaskLine(progress);
        panel.push_back('\n');

        if (progress.total_bytes) {
            total_all += *progress.total_bytes;
        } else {
            total_known = false;
        }
        downloaded_all += progress.downloaded_bytes;
    }

    panel.append("--------------------------------------------------\n");
    const auto overall = total_known ? computePercent(downloaded_all, total_all) : std::nullopt;
    if (overall) {
        panel += fmt::format("Overall: {:>3}% ({}/{})",
                             *overall,
                             detail::formatBytes(downloaded_all),
                             detail::formatBytes(total_all));
    } else {
        panel += fmt::format("Overall: {} downloaded", detail::formatBytes(downloaded_all));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ConsoleController::formatTaskLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name = std::filesystem::path{progress.destination}.filename().string();
    if (display_name.empty()) {
        display_name = progress.url;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }

    if (progress.state == TaskState::Pending) {
        line += fmt::format("{:<20} [Waiting...]", display_name);
    } else if (progress.percent) {
        constexpr int bar_width = 30;
        const int bar_pos = *progress.percent * bar_width / 100;

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            *progress.percent,
                            detail::formatBytes(progress.downloaded_bytes),
                            detail::formatBytes(progress.total_bytes.value_or(0)));
    } else {
        // Unknown or zero length: report bytes only.
        line += fmt::format("{:<20} [{:^30}]  ??% ({})",
                            display_name,
                            "size unknown",
                            detail::formatBytes(progress.downloaded_bytes));
    }

    switch (progress.state) {
    case TaskState::Completed:
        line.append("  ✅ Done");
        break;
    case TaskState::Failed:
        line += fmt::format("  ❌ {}", progress.error_message);
        break;
    case TaskState::Interrupted:
        line.append("  ⏹ Interrupted");
        break;
    default:
        break;
    }

    return line;
}

void ConsoleController::redrawPanel(const std::string& panel) {
    if (rendered_lines_ > 0) {
        // Cursor to the start of the previous frame, then clear to the end.
        out_ << fmt::format("\033[{}F\033[J", rendered_lines_);
    }
    out_ << panel << std::flush;
    rendered_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

} // namespace pfetch
