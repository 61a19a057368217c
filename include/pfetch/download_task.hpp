#pragma once

#include "event.hpp"
#include "progress.hpp"
#include "transfer_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pfetch {

// One download attempt: Pending -> Running -> Completed | Failed | Interrupted.
// A retry is a new task.
class DownloadTask {
public:
    DownloadTask(std::string url, std::filesystem::path destination, TransferEnginePtr engine);

    // Requests cancellation and joins the engine thread.
    ~DownloadTask();

    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // Launches the engine on its own thread and returns immediately.
    // Throws AlreadyStarted unless the task is Pending.
    void start();

    // Idempotent; a no-op once the task is terminal.
    void cancel();

    // Listeners run on the engine thread, in emission order. They must not
    // block for long and must not call subscribe().
    void subscribe(EventListener listener);

    // Blocks until the terminal event has been delivered to every listener.
    void wait() const;
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] const std::string& getId() const { return id_; }
    [[nodiscard]] const std::string& getUrl() const { return url_; }
    [[nodiscard]] const std::filesystem::path& getDestination() const { return destination_; }

    [[nodiscard]] TaskState getState() const { return state_.load(); }
    [[nodiscard]] std::uint64_t getBytesDownloaded() const { return downloaded_bytes_.load(); }
    [[nodiscard]] std::optional<std::uint64_t> getTotalBytes() const;
    [[nodiscard]] bool isCancelRequested() const { return cancel_requested_.load(); }
    [[nodiscard]] bool isRunning() const { return getState() == TaskState::Running; }
    [[nodiscard]] bool isFinished() const { return isTerminal(getState()); }

    // Consistent copy of all counters and the state.
    [[nodiscard]] Progress getProgress() const;

private:
    void runEngine();
    void relay(EventPayload payload);
    void notifyListeners(const DownloadEvent& event);

    const std::string id_;
    const std::string url_;
    const std::filesystem::path destination_;
    TransferEnginePtr engine_;
    std::thread thread_;

    std::atomic<bool> cancel_requested_{false};
    std::atomic<TaskState> state_{TaskState::Pending};
    std::atomic<std::uint64_t> downloaded_bytes_{0};

    mutable std::mutex state_mutex_;
    mutable std::condition_variable done_condition_;
    std::optional<std::uint64_t> total_bytes_;
    std::string error_message_;
    bool terminal_emitted_{false};
    bool done_{false};

    std::mutex listeners_mutex_;
    std::vector<EventListener> listeners_;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace pfetch
