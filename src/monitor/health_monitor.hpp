#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "servers/port_allocator.hpp"
#include "servers/registry.hpp"

namespace tooldock::monitor {

struct ReapedServer {
    std::string name;
    int pid = 0;
    int port = 0;
    std::optional<int> exit_code;
};

// Background liveness loop. Removes servers whose process exited from the
// active table; it never restarts them.
class HealthMonitor {
public:
    using ExitHandler = std::function<void(const ReapedServer&)>;

    HealthMonitor(tooldock::servers::Registry& registry,
                  tooldock::servers::PortAllocator& ports,
                  std::chrono::milliseconds interval,
                  ExitHandler on_exit = {});
    ~HealthMonitor();

    void Start();
    void Stop();
    bool IsRunning() const { return running_; }
    // Never below 100ms, so the loop cannot spin.
    std::chrono::milliseconds Interval() const { return interval_; }

    // One reconciliation pass; returns the servers it removed.
    std::vector<ReapedServer> CheckNow();

private:
    void RunLoop();

    tooldock::servers::Registry& registry_;
    tooldock::servers::PortAllocator& ports_;
    std::chrono::milliseconds interval_;
    ExitHandler on_exit_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

}  // namespace tooldock::monitor
