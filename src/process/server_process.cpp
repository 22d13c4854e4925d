#include "process/server_process.hpp"

#include <fstream>
#include <utility>

#include "utils/common.hpp"

namespace tooldock::process {

const char* ToString(ServerStatus status) {
    switch (status) {
        case ServerStatus::kStopped: return "stopped";
        case ServerStatus::kStarting: return "starting";
        case ServerStatus::kRunning: return "running";
        case ServerStatus::kCrashed: return "crashed";
    }
    return "stopped";
}

bool LogFiles::Open(const std::filesystem::path& dir, const std::string& name, std::string* error) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        if (error) {
            *error = "cannot create log directory " + dir.string() + ": " + ec.message();
        }
        return false;
    }
    out_path = dir / (name + ".out.log");
    err_path = dir / (name + ".err.log");
    // "e" sets O_CLOEXEC.
    out.reset(std::fopen(out_path.c_str(), "we"));
    err.reset(std::fopen(err_path.c_str(), "we"));
    if (!out || !err) {
        if (error) {
            *error = "cannot open log files under " + dir.string();
        }
        Close();
        return false;
    }
    return true;
}

void LogFiles::Close() {
    out.reset();
    err.reset();
}

std::string ReadTail(const std::filesystem::path& path, std::size_t max_bytes) {
    std::ifstream input(path, std::ios::binary | std::ios::ate);
    if (!input.is_open()) {
        return {};
    }
    const auto size = static_cast<std::size_t>(input.tellg());
    const auto start = size > max_bytes ? size - max_bytes : 0;
    input.seekg(static_cast<std::streamoff>(start));
    std::string tail(size - start, '\0');
    input.read(tail.data(), static_cast<std::streamsize>(tail.size()));
    tail.resize(static_cast<std::size_t>(input.gcount()));
    return tail;
}

ServerProcess::ServerProcess(std::shared_ptr<const tooldock::servers::ServerDefinition> definition,
                             std::shared_ptr<ChildHandle> child,
                             int port,
                             LogFiles logs)
    : definition_(std::move(definition))
    , child_(std::move(child))
    , port_(port)
    , started_at_(tooldock::utils::Now())
    , log_path_(logs.out_path)
    , err_path_(logs.err_path)
    , logs_(std::move(logs)) {}

ServerProcess::~ServerProcess() {
    CloseLogs();
}

ServerStatus ServerProcess::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void ServerProcess::SetStatus(ServerStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

void ServerProcess::CloseLogs() {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.Close();
}

bool ServerProcess::LogsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_.out != nullptr || logs_.err != nullptr;
}

}  // namespace tooldock::process
