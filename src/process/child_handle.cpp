#include "process/child_handle.hpp"

#include <cerrno>
#include <signal.h>
#include <sys/wait.h>
#include <thread>

namespace tooldock::process {

ChildHandle::ChildHandle(pid_t pid) : pid_(pid) {}

bool ChildHandle::Poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
        return false;
    }
    int status = 0;
    const auto waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == 0) {
        return true;
    }
    if (waited == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        exited_ = true;
        return false;
    }
    if (errno == EINTR) {
        return true;
    }
    // ECHILD: the pid is gone and its status was collected elsewhere.
    exited_ = true;
    return false;
}

bool ChildHandle::HasExited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
}

std::optional<int> ChildHandle::ExitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

bool ChildHandle::Signal(int signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
        return false;
    }
    return ::kill(pid_, signal) == 0;
}

bool ChildHandle::WaitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!Poll()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !Poll();
}

}  // namespace tooldock::process
