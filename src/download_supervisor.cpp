#include "pfetch/download_supervisor.hpp"
#include "pfetch/curl_transfer_engine.hpp"
#include "pfetch/detail/destination.hpp"
#include "pfetch/errors.hpp"
#include "pfetch/log.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace pfetch {

class DownloadSupervisor::Impl : public std::enable_shared_from_this<Impl> {
public:
    Impl(SupervisorOptions options, EngineFactory engine_factory)
        : options_(std::move(options)),
          engine_factory_(std::move(engine_factory)),
          channel_(options_.event_capacity) {
        if (!engine_factory_) {
            throw std::invalid_argument("Engine factory must not be empty");
        }

        std::error_code ec;
        std::filesystem::create_directories(options_.download_directory, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: "
                + options_.download_directory.string() + " - " + ec.message());
        }
    }

    DownloadTaskPtr add(const std::string& url) {
        if (url.empty()) {
            throw std::invalid_argument("Download URL must not be empty");
        }

        DownloadTaskPtr task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            task = std::make_shared<DownloadTask>(url, chooseDestination(url), engine_factory_());
            tasks_.push_back(task);
            by_id_.emplace(task->getId(), task);
        }

        std::weak_ptr<Impl> weak = shared_from_this();
        task->subscribe([weak](const DownloadEvent& event) {
            if (auto self = weak.lock()) {
                self->onTaskEvent(event);
            }
        });

        log::get()->debug("Added download {} for {} -> {}", task->getId(), url, task->getDestination().string());
        return task;
    }

    void start(const std::string& id) {
        std::vector<DownloadTaskPtr> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto task = lookup(id);
            if (task->getState() != TaskState::Pending || isQueued(id)) {
                throw AlreadyStarted(id);
            }
            start_queue_.push_back(id);
            batch = takeLaunchable();
        }
        launch(std::move(batch));
    }

    void startAll() {
        std::vector<DownloadTaskPtr> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& task : tasks_) {
                if (task->getState() == TaskState::Pending && !isQueued(task->getId())) {
                    start_queue_.push_back(task->getId());
                }
            }
            batch = takeLaunchable();
        }
        launch(std::move(batch));
    }

    void cancel(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        lookup(id)->cancel();
    }

    void cancelAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t requested = 0;
        for (const auto& task : tasks_) {
            if (!task->isFinished()) {
                task->cancel();
                ++requested;
            }
        }
        log::get()->info("Cancelling {} download(s)", requested);
    }

    void remove(const std::string& id) {
        DownloadTaskPtr removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto task = lookup(id);
            if (isActive(task)) {
                throw HasActiveDownloads();
            }

            start_queue_.erase(std::remove(start_queue_.begin(), start_queue_.end(), id), start_queue_.end());
            tasks_.erase(std::remove(tasks_.begin(), tasks_.end(), task), tasks_.end());
            by_id_.erase(id);
            removed = std::move(task);
        }
        log::get()->debug("Removed download {}", id);
    }

    void clear() {
        std::vector<DownloadTaskPtr> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const bool any_active = std::any_of(tasks_.begin(), tasks_.end(),
                                                [this](const DownloadTaskPtr& task) { return isActive(task); });
            if (any_active) {
                throw HasActiveDownloads();
            }

            removed.swap(tasks_);
            by_id_.clear();
            start_queue_.clear();
        }
        log::get()->debug("Cleared {} download(s)", removed.size());
    }

    // Cancels and waits; runs before the last reference to Impl goes away.
    void shutdown() {
        std::vector<DownloadTaskPtr> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            start_queue_.clear();
            tasks = tasks_;
        }

        for (const auto& task : tasks) {
            task->cancel();
        }
        waitAll();
        channel_.close();
    }

    [[nodiscard]] DownloadTaskPtr find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_id_.find(id);
        return it == by_id_.end() ? nullptr : it->second;
    }

    [[nodiscard]] std::vector<DownloadTaskPtr> tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_;
    }

    [[nodiscard]] std::vector<Progress> snapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Progress> out;
        out.reserve(tasks_.size());
        for (const auto& task : tasks_) {
            out.push_back(task->getProgress());
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    [[nodiscard]] std::size_t activeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return runningCount();
    }

    [[nodiscard]] bool allFinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::all_of(tasks_.begin(), tasks_.end(),
                           [](const DownloadTaskPtr& task) { return task->isFinished(); });
    }

    // A task counts as done once its listeners have returned, so no engine
    // thread still holds a reference to Impl afterwards.
    void waitAll() const {
        while (true) {
            std::vector<DownloadTaskPtr> started;
            bool waiting_for_slot = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto& task : tasks_) {
                    if (task->getState() != TaskState::Pending) {
                        started.push_back(task);
                    }
                }
                waiting_for_slot = !start_queue_.empty() || !launching_.empty();
            }

            for (const auto& task : started) {
                task->wait();
            }

            if (!waiting_for_slot) {
                return;
            }
            // Another thread is between taking a slot and starting the task.
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    EventChannel& events() { return channel_; }
    const SupervisorOptions& options() const { return options_; }

private:
    void onTaskEvent(const DownloadEvent& event) {
        channel_.publish(event);

        if (event.isTerminal()) {
            std::vector<DownloadTaskPtr> batch;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                batch = takeLaunchable();
            }
            launch(std::move(batch));
        }
    }

    // Requires mutex_. Reserves a slot for every queued task that may start now.
    std::vector<DownloadTaskPtr> takeLaunchable() {
        std::vector<DownloadTaskPtr> batch;
        std::size_t busy = runningCount() + launching_.size();

        while (!start_queue_.empty() && (options_.max_concurrent == 0 || busy < options_.max_concurrent)) {
            const std::string id = start_queue_.front();
            start_queue_.pop_front();

            auto it = by_id_.find(id);
            if (it == by_id_.end() || it->second->getState() != TaskState::Pending) {
                continue;
            }

            launching_.insert(id);
            batch.push_back(it->second);
            ++busy;
        }

        return batch;
    }

    // Called without mutex_: a task whose thread cannot be spawned reports
    // its failure synchronously, which re-enters onTaskEvent.
    void launch(std::vector<DownloadTaskPtr> batch) {
        while (!batch.empty()) {
            for (const auto& task : batch) {
                try {
                    task->start();
                } catch (const AlreadyStarted& ex) {
                    log::get()->warn("{}", ex.what());
                }
            }

            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& task : batch) {
                launching_.erase(task->getId());
            }
            // Tasks that finished while their successors were being reserved
            // may have freed slots nobody claimed yet.
            batch = takeLaunchable();
        }
    }

    // Requires mutex_.
    DownloadTaskPtr lookup(const std::string& id) const {
        auto it = by_id_.find(id);
        if (it == by_id_.end()) {
            throw UnknownTask(id);
        }
        return it->second;
    }

    // Requires mutex_.
    bool isQueued(const std::string& id) const {
        return std::find(start_queue_.begin(), start_queue_.end(), id) != start_queue_.end();
    }

    // Requires mutex_.
    bool isActive(const DownloadTaskPtr& task) const {
        return task->isRunning() || launching_.count(task->getId()) != 0;
    }

    // Requires mutex_.
    std::size_t runningCount() const {
        return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                                       [](const DownloadTaskPtr& task) { return task->isRunning(); }));
    }

    // Requires mutex_.
    std::filesystem::path chooseDestination(const std::string& url) const {
        std::string name = detail::filenameFromUrl(url);
        if (name.empty()) {
            name = detail::fallbackFilename(tasks_.size() + 1);
        }

        return detail::uniquePath(options_.download_directory / name, [this](const std::filesystem::path& path) {
            std::error_code ec;
            if (std::filesystem::exists(path, ec)) {
                return true;
            }
            return std::any_of(tasks_.begin(), tasks_.end(),
                               [&path](const DownloadTaskPtr& task) { return task->getDestination() == path; });
        });
    }

    const SupervisorOptions options_;
    const EngineFactory engine_factory_;
    EventChannel channel_;

    mutable std::mutex mutex_;
    std::vector<DownloadTaskPtr> tasks_;
    std::unordered_map<std::string, DownloadTaskPtr> by_id_;
    std::deque<std::string> start_queue_;
    std::unordered_set<std::string> launching_;
};

DownloadSupervisor::DownloadSupervisor(SupervisorOptions options)
    : DownloadSupervisor(options, CurlTransferEngine::factory(options.engine)) {}

DownloadSupervisor::DownloadSupervisor(SupervisorOptions options, EngineFactory engine_factory)
    : impl_(std::make_shared<Impl>(std::move(options), std::move(engine_factory))) {}

DownloadSupervisor::~DownloadSupervisor() {
    impl_->shutdown();
}

DownloadTaskPtr DownloadSupervisor::add(const std::string& url) { return impl_->add(url); }

void DownloadSupervisor::start(const std::string& id) { impl_->start(id); }

void DownloadSupervisor::startAll() { impl_->startAll(); }

void DownloadSupervisor::cancel(const std::string& id) { impl_->cancel(id); }

void DownloadSupervisor::cancelAll() { impl_->cancelAll(); }

void DownloadSupervisor::remove(const std::string& id) { impl_->remove(id); }

void DownloadSupervisor::clear() { impl_->clear(); }

DownloadTaskPtr DownloadSupervisor::find(const std::string& id) const { return impl_->find(id); }

std::vector<DownloadTaskPtr> DownloadSupervisor::tasks() const { return impl_->tasks(); }

std::vector<Progress> DownloadSupervisor::snapshots() const { return impl_->snapshots(); }

std::size_t DownloadSupervisor::size() const { return impl_->size(); }

std::size_t DownloadSupervisor::activeCount() const { return impl_->activeCount(); }

bool DownloadSupervisor::allFinished() const { return impl_->allFinished(); }

void DownloadSupervisor::waitAll() const { impl_->waitAll(); }

EventChannel& DownloadSupervisor::events() { return impl_->events(); }

const SupervisorOptions& DownloadSupervisor::options() const { return impl_->options(); }

} // namespace pfetch
