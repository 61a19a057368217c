#include "pfetch/event.hpp"

#include <type_traits>

namespace pfetch {

EventKind kindOf(const EventPayload& payload) {
    return std::visit(
        [](const auto& value) -> EventKind {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ProgressPayload>) {
                return EventKind::Progress;
            } else if constexpr (std::is_same_v<T, CompletedPayload>) {
                return EventKind::Completed;
            } else if constexpr (std::is_same_v<T, ErrorPayload>) {
                return EventKind::Error;
            } else {
                return EventKind::Interrupted;
            }
        },
        payload);
}

bool isTerminal(const EventPayload& payload) {
    return kindOf(payload) != EventKind::Progress;
}

EventKind DownloadEvent::kind() const { return kindOf(payload); }

bool DownloadEvent::isTerminal() const { return pfetch::isTerminal(payload); }

std::string_view toString(EventKind kind) {
    switch (kind) {
    case EventKind::Progress:
        return "progress";
    case EventKind::Completed:
        return "completed";
    case EventKind::Error:
        return "error";
    case EventKind::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

std::string_view toString(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Network:
        return "network";
    case ErrorCategory::FileSystem:
        return "filesystem";
    case ErrorCategory::Internal:
        return "internal";
    }
    return "unknown";
}

} // namespace pfetch
