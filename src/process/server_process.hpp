#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "process/child_handle.hpp"
#include "servers/server_definition.hpp"

namespace tooldock::process {

enum class ServerStatus {
    kStopped,
    kStarting,
    kRunning,
    kCrashed
};

const char* ToString(ServerStatus status);

struct FileCloser {
    void operator()(std::FILE* file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

// Per-server stdout/stderr capture files, truncated on every open.
struct LogFiles {
    std::filesystem::path out_path;
    std::filesystem::path err_path;
    FilePtr out;
    FilePtr err;

    bool Open(const std::filesystem::path& dir, const std::string& name, std::string* error);
    void Close();
};

// Reads at most max_bytes from the end of path.
std::string ReadTail(const std::filesystem::path& path, std::size_t max_bytes);

class ServerProcess {
public:
    ServerProcess(std::shared_ptr<const tooldock::servers::ServerDefinition> definition,
                  std::shared_ptr<ChildHandle> child,
                  int port,
                  LogFiles logs);
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    const std::string& Name() const { return definition_->name; }
    const tooldock::servers::ServerDefinition& Definition() const { return *definition_; }
    ChildHandle& Child() { return *child_; }
    const ChildHandle& Child() const { return *child_; }
    int Port() const { return port_; }
    std::chrono::system_clock::time_point StartedAt() const { return started_at_; }
    const std::filesystem::path& LogPath() const { return log_path_; }
    const std::filesystem::path& ErrPath() const { return err_path_; }

    ServerStatus Status() const;
    void SetStatus(ServerStatus status);

    // Set by stop before signalling; the monitor leaves such entries to stop.
    void RequestStop() { stop_requested_ = true; }
    bool StopRequested() const { return stop_requested_; }

    // Idempotent; safe to call from stop and from the monitor.
    void CloseLogs();
    bool LogsOpen() const;

private:
    std::shared_ptr<const tooldock::servers::ServerDefinition> definition_;
    std::shared_ptr<ChildHandle> child_;
    int port_;
    std::chrono::system_clock::time_point started_at_;
    std::filesystem::path log_path_;
    std::filesystem::path err_path_;

    mutable std::mutex mutex_;
    LogFiles logs_;
    ServerStatus status_ = ServerStatus::kStarting;
    std::atomic<bool> stop_requested_{false};
};

}  // namespace tooldock::process
