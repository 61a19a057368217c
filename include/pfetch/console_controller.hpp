#pragma once

#include "download_supervisor.hpp"
#include "event.hpp"
#include "progress.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace pfetch {

struct DownloadSummary {
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t interrupted{0};
};

// Terminal front end: renders a progress panel from the supervisor's event
// channel until every download has reported its terminal event.
class ConsoleController {
public:
    ConsoleController(DownloadSupervisor& supervisor, std::ostream& out);

    // interrupt_requested is polled between redraws; the first time it is set
    // every unfinished download is cancelled.
    DownloadSummary run(const std::atomic<bool>& interrupt_requested);

    // Folds one event into the panel rows. Returns false for unknown ids.
    bool applyEvent(const DownloadEvent& event);

    [[nodiscard]] bool allFinished() const;
    [[nodiscard]] DownloadSummary summary() const;
    [[nodiscard]] std::vector<Progress> rows() const;

    [[nodiscard]] std::string buildProgressPanel() const;
    static std::string formatTaskLine(const Progress& progress);

    void setRefreshInterval(std::chrono::milliseconds interval) { refresh_interval_ = interval; }

private:
    void loadRows();
    // Moves the cursor back over the last frame before printing the new one.
    void redrawPanel(const std::string& panel);

    DownloadSupervisor& supervisor_;
    std::ostream& out_;
    std::chrono::milliseconds refresh_interval_{200};
    std::size_t rendered_lines_{0};

    std::vector<std::string> order_;
    std::unordered_map<std::string, Progress> rows_;
};

} // namespace pfetch
