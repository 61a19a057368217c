#include "pfetch/download_task.hpp"
#include "pfetch/detail/task_id.hpp"
#include "pfetch/errors.hpp"
#include "pfetch/log.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pfetch {

DownloadTask::DownloadTask(std::string url, std::filesystem::path destination, TransferEnginePtr engine)
    : id_(detail::generateTaskId()),
      url_(std::move(url)),
      destination_(std::move(destination)),
      engine_(std::move(engine)) {}

DownloadTask::~DownloadTask() {
    cancel_requested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DownloadTask::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.load() != TaskState::Pending) {
            throw AlreadyStarted(id_);
        }
        state_.store(TaskState::Running);
    }

    log::get()->debug("Starting download {} ({})", id_, url_);

    try {
        thread_ = std::thread([this]() { runEngine(); });
    } catch (const std::system_error& ex) {
        relay(ErrorPayload{ErrorCategory::Internal, std::string{"Cannot start download thread: "} + ex.what()});
    }
}

void DownloadTask::cancel() {
    if (isTerminal(state_.load())) {
        return;
    }
    if (!cancel_requested_.exchange(true)) {
        log::get()->debug("Cancellation requested for {}", id_);
    }
}

void DownloadTask::subscribe(EventListener listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void DownloadTask::wait() const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    done_condition_.wait(lock, [this] { return done_; });
}

bool DownloadTask::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return done_condition_.wait_for(lock, timeout, [this] { return done_; });
}

std::optional<std::uint64_t> DownloadTask::getTotalBytes() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return total_bytes_;
}

Progress DownloadTask::getProgress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const std::uint64_t downloaded = downloaded_bytes_.load();
    return {
        id_,
        url_,
        destination_.string(),
        state_.load(),
        downloaded,
        total_bytes_,
        computePercent(downloaded, total_bytes_),
        error_message_
    };
}

void DownloadTask::runEngine() {
    try {
        engine_->run(url_, destination_, cancel_requested_, [this](EventPayload payload) { relay(std::move(payload)); });
    } catch (const std::exception& ex) {
        log::get()->error("Transfer engine for {} threw: {}", id_, ex.what());
        relay(ErrorPayload{ErrorCategory::Internal, ex.what()});
    }

    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished = terminal_emitted_;
    }
    if (!finished) {
        relay(ErrorPayload{ErrorCategory::Internal, "Transfer ended without a result"});
    }
}

// The only place state leaves Running.
void DownloadTask::relay(EventPayload payload) {
    const bool terminal = isTerminal(payload);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (terminal_emitted_) {
            log::get()->warn("Ignoring {} event for finished download {}", toString(kindOf(payload)), id_);
            return;
        }

        std::visit(
            [this](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, ProgressPayload>) {
                    downloaded_bytes_.store(std::max(downloaded_bytes_.load(), value.bytes_downloaded));
                    total_bytes_ = value.total_bytes;
                } else if constexpr (std::is_same_v<T, CompletedPayload>) {
                    downloaded_bytes_.store(std::max(downloaded_bytes_.load(), value.bytes_downloaded));
                    state_.store(TaskState::Completed);
                } else if constexpr (std::is_same_v<T, ErrorPayload>) {
                    error_message_ = value.message;
                    state_.store(TaskState::Failed);
                } else {
                    state_.store(TaskState::Interrupted);
                }
            },
            payload);

        terminal_emitted_ = terminal;
    }

    notifyListeners(DownloadEvent{id_, std::move(payload)});

    if (terminal) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            done_ = true;
        }
        done_condition_.notify_all();
    }
}

void DownloadTask::notifyListeners(const DownloadEvent& event) {
    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            log::get()->error("Listener for download {} threw: {}", id_, ex.what());
        }
    }
}

} // namespace pfetch
