#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <sys/types.h>

namespace tooldock::process {

// Owns the reaping of one child pid. Every waitpid/kill for the pid goes through
// here so the monitor thread and a concurrent stop never race on a reaped pid.
class ChildHandle {
public:
    explicit ChildHandle(pid_t pid);

    pid_t Pid() const { return pid_; }

    // Non-blocking. Returns true while the child runs; reaps it and records the
    // exit code once it has exited.
    bool Poll();
    bool HasExited() const;
    std::optional<int> ExitCode() const;

    // Returns false without signalling once the child has been reaped.
    bool Signal(int signal);

    // Polls until the child exits or timeout elapses.
    bool WaitForExit(std::chrono::milliseconds timeout);

private:
    pid_t pid_;
    mutable std::mutex mutex_;
    bool exited_ = false;
    std::optional<int> exit_code_;
};

}  // namespace tooldock::process
