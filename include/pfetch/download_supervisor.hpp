#pragma once

#include "download_task.hpp"
#include "event_channel.hpp"
#include "progress.hpp"
#include "transfer_engine.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pfetch {

struct SupervisorOptions {
    std::filesystem::path download_directory{"."};
    // 0 runs every started task at once, one thread each.
    std::size_t max_concurrent{0};
    // 0 leaves the event channel unbounded.
    std::size_t event_capacity{0};
    EngineOptions engine;
};

// Owns the downloads of one session in creation order and funnels their
// events into a single channel for the controller.
class DownloadSupervisor {
public:
    explicit DownloadSupervisor(SupervisorOptions options = {});
    DownloadSupervisor(SupervisorOptions options, EngineFactory engine_factory);

    // Cancels everything and waits for running downloads to finish.
    ~DownloadSupervisor();

    DownloadSupervisor(const DownloadSupervisor&) = delete;
    DownloadSupervisor& operator=(const DownloadSupervisor&) = delete;

    /**
     * Registers a Pending download for url. The destination is the URL's
     * last path segment (or "download_<n>") inside the download directory,
     * suffixed "__<k>" when that path exists or belongs to another task.
     * @throws std::invalid_argument if url is empty
     */
    DownloadTaskPtr add(const std::string& url);

    /**
     * Starts a Pending download, or queues it while max_concurrent
     * downloads are running.
     * @throws UnknownTask, AlreadyStarted
     */
    void start(const std::string& id);

    // Starts every Pending download; others are left alone.
    void startAll();

    /// @throws UnknownTask
    void cancel(const std::string& id);

    // Requests cancellation of every unfinished download without waiting.
    void cancelAll();

    /// @throws UnknownTask, HasActiveDownloads
    void remove(const std::string& id);

    /// @throws HasActiveDownloads if any download is running
    void clear();

    [[nodiscard]] DownloadTaskPtr find(const std::string& id) const;
    [[nodiscard]] std::vector<DownloadTaskPtr> tasks() const;
    [[nodiscard]] std::vector<Progress> snapshots() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] bool allFinished() const;

    // Blocks until every started download has delivered its terminal event
    // and nothing is waiting for a slot. Once it returns, all terminal events
    // are in events().
    void waitAll() const;

    [[nodiscard]] EventChannel& events();
    [[nodiscard]] const SupervisorOptions& options() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace pfetch
