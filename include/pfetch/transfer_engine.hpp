#pragma once

#include "event.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace pfetch {

inline constexpr std::size_t kChunkSize = 4096;

struct EngineOptions {
    std::chrono::seconds connect_timeout{30};
    // A transfer slower than low_speed_limit bytes/s for low_speed_time is
    // treated as stalled. A zero limit disables the check.
    long low_speed_limit{1};
    std::chrono::seconds low_speed_time{60};
    // Zero means no limit on the whole transfer.
    std::chrono::seconds total_timeout{0};
    bool follow_redirects{true};
    long max_redirects{10};
    std::string user_agent{"pfetch/1.0"};
};

using PayloadSink = std::function<void(EventPayload)>;

// One streamed GET of one URL into one file. run() delivers zero or more
// progress payloads followed by exactly one terminal payload, all on the
// calling thread, and checks cancel_requested between chunks.
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    virtual void run(const std::string& url,
                     const std::filesystem::path& destination,
                     const std::atomic<bool>& cancel_requested,
                     const PayloadSink& sink) = 0;
};

using TransferEnginePtr = std::unique_ptr<TransferEngine>;
using EngineFactory = std::function<TransferEnginePtr()>;

} // namespace pfetch
