#include "pfetch/event_channel.hpp"
#include "pfetch/log.hpp"

#include <utility>

namespace pfetch {

EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity) {}

bool EventChannel::publish(DownloadEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        const bool full = capacity_ != 0 && queue_.size() >= capacity_;
        if (full && !event.isTerminal()) {
            if (!coalesceProgress(event)) {
                ++dropped_progress_;
                log::get()->trace("Dropped progress event for {}, channel full", event.task_id);
            }
            return true;
        }

        queue_.push_back(std::move(event));
    }

    available_.notify_one();
    return true;
}

// Replaces the newest queued event of the same task when it is a progress
// update. Nothing later for that task is queued behind it, so per-task order
// still holds.
bool EventChannel::coalesceProgress(DownloadEvent& event) {
    for (auto it = queue_.rbegin(); it != queue_.rend(); ++it) {
        if (it->task_id != event.task_id) {
            continue;
        }
        if (it->kind() != EventKind::Progress) {
            return false;
        }
        it->payload = std::move(event.payload);
        return true;
    }
    return false;
}

std::optional<DownloadEvent> EventChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }

    DownloadEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<DownloadEvent> EventChannel::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }

    DownloadEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<DownloadEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadEvent> events;
    events.reserve(queue_.size());
    for (auto& event : queue_) {
        events.push_back(std::move(event));
    }
    queue_.clear();
    return events;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t EventChannel::droppedProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_progress_;
}

} // namespace pfetch
