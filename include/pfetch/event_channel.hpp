#pragma once

#include "event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace pfetch {

// Multi-producer / single-consumer hand-off from engine threads to the
// controller. publish() never waits for the consumer. With a bounded
// capacity, progress events beyond it are coalesced or dropped; terminal
// events are always queued.
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 0);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool publish(DownloadEvent event);

    [[nodiscard]] std::optional<DownloadEvent> tryPop();
    [[nodiscard]] std::optional<DownloadEvent> waitPop(std::chrono::milliseconds timeout);
    [[nodiscard]] std::vector<DownloadEvent> drain();

    // Wakes any waiting consumer; later publishes are refused.
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::size_t droppedProgress() const;

private:
    bool coalesceProgress(DownloadEvent& event);

    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<DownloadEvent> queue_;
    std::size_t dropped_progress_{0};
    bool closed_{false};
};

} // namespace pfetch
