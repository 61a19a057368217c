#pragma once

#include <stdexcept>
#include <string>

namespace pfetch {

// Precondition violations of the task/supervisor API. Download-time faults
// are never thrown; they arrive as Error events instead.
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class AlreadyStarted final : public UsageError {
public:
    explicit AlreadyStarted(const std::string& task_id)
        : UsageError("Download " + task_id + " has already been started") {}
};

class HasActiveDownloads final : public UsageError {
public:
    HasActiveDownloads()
        : UsageError("Cannot remove downloads while they are running") {}
};

class UnknownTask final : public UsageError {
public:
    explicit UnknownTask(const std::string& task_id)
        : UsageError("No download with id " + task_id) {}
};

} // namespace pfetch
