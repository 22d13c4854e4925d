#include "monitor/health_monitor.hpp"

#include <algorithm>
#include <utility>

#include "utils/logging.hpp"

namespace tooldock::monitor {
namespace {

constexpr std::chrono::milliseconds kMinInterval{100};

}  // namespace

using tooldock::process::ServerStatus;

HealthMonitor::HealthMonitor(tooldock::servers::Registry& registry,
                             tooldock::servers::PortAllocator& ports,
                             std::chrono::milliseconds interval,
                             ExitHandler on_exit)
    : registry_(registry)
    , ports_(ports)
    , interval_(std::max(interval, kMinInterval))
    , on_exit_(std::move(on_exit)) {}

HealthMonitor::~HealthMonitor() {
    Stop();
}

void HealthMonitor::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void HealthMonitor::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void HealthMonitor::RunLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, interval_, [this]() { return !running_; });
        }
        if (!running_) {
            break;
        }
        CheckNow();
    }
}

std::vector<ReapedServer> HealthMonitor::CheckNow() {
    std::vector<ReapedServer> reaped;
    // waitpid(WNOHANG) per entry, so one wedged child cannot delay the others.
    for (const auto& [name, process] : registry_.ActiveSnapshot()) {
        auto& child = process->Child();
        if (child.Poll()) {
            continue;
        }
        // Checked after the poll: a stop that signalled this child owns its removal.
        if (process->StopRequested()) {
            continue;
        }
        if (!registry_.RemoveActiveIf(name, process.get())) {
            continue;
        }
        process->CloseLogs();
        process->SetStatus(ServerStatus::kCrashed);
        ports_.Release(name, process->Port());

        ReapedServer entry{};
        entry.name = name;
        entry.pid = static_cast<int>(child.Pid());
        entry.port = process->Port();
        entry.exit_code = child.ExitCode();
        registry_.SetStatus(name, ServerStatus::kCrashed, entry.port, entry.exit_code);

        tooldock::utils::LogWarn("monitor", name + " exited unexpectedly pid=" + std::to_string(entry.pid) +
                                 " exit=" + (entry.exit_code ? std::to_string(*entry.exit_code) : "unknown"));
        if (on_exit_) {
            on_exit_(entry);
        }
        reaped.push_back(std::move(entry));
    }
    return reaped;
}

}  // namespace tooldock::monitor
