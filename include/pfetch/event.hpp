#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pfetch {

enum class EventKind {
    Progress,
    Completed,
    Error,
    Interrupted,
};

enum class ErrorCategory {
    Network,
    FileSystem,
    // Faults outside the transfer itself, e.g. a thread that could not be spawned.
    Internal,
};

struct ProgressPayload {
    std::uint64_t bytes_downloaded{0};
    // Empty when the server sent no content length.
    std::optional<std::uint64_t> total_bytes;
    // Empty when the total is unknown or zero.
    std::optional<int> percent;
};

struct CompletedPayload {
    std::uint64_t bytes_downloaded{0};
    std::string destination;
};

struct ErrorPayload {
    ErrorCategory category{ErrorCategory::Network};
    std::string message;
};

struct InterruptedPayload {
    std::uint64_t bytes_downloaded{0};
};

using EventPayload = std::variant<ProgressPayload, CompletedPayload, ErrorPayload, InterruptedPayload>;

struct DownloadEvent {
    std::string task_id;
    EventPayload payload;

    [[nodiscard]] EventKind kind() const;
    [[nodiscard]] bool isTerminal() const;
};

using EventListener = std::function<void(const DownloadEvent&)>;

[[nodiscard]] EventKind kindOf(const EventPayload& payload);
[[nodiscard]] bool isTerminal(const EventPayload& payload);

std::string_view toString(EventKind kind);
std::string_view toString(ErrorCategory category);

} // namespace pfetch
