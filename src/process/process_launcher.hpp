#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "config/config_schema.hpp"
#include "process/server_process.hpp"
#include "servers/port_allocator.hpp"
#include "servers/registry.hpp"
#include "supervisor/errors.hpp"

namespace tooldock::process {

struct LaunchResult {
    bool ok = false;
    // True when the server was already active and nothing was spawned.
    bool already_running = false;
    std::shared_ptr<ServerProcess> process;
    tooldock::supervisor::SupervisorError error;
};

struct StopResult {
    bool ok = false;
    bool was_running = false;
    bool forced = false;
    std::optional<int> exit_code;
    tooldock::supervisor::SupervisorError error;
};

class ProcessLauncher {
public:
    ProcessLauncher(const tooldock::config::SupervisorConfig& config,
                    tooldock::servers::Registry& registry,
                    tooldock::servers::PortAllocator& ports);

    // Idempotent: returns the existing process when name is already active.
    LaunchResult Start(const std::string& name);
    // No-op success when name is not active. SIGTERM, then SIGKILL after the stop timeout.
    StopResult Stop(const std::string& name);
    LaunchResult Restart(const std::string& name);

    // Each server is attempted independently; one failure does not abort the batch.
    std::map<std::string, LaunchResult> StartAll();
    std::map<std::string, StopResult> StopAll();


private:
    std::mutex& LifecycleMutex(const std::string& name);
    LaunchResult Spawn(const std::shared_ptr<const tooldock::servers::ServerDefinition>& def);
    bool WaitUntilReady(ChildHandle& child, int port) const;

    tooldock::config::SupervisorConfig config_;
    tooldock::servers::Registry& registry_;
    tooldock::servers::PortAllocator& ports_;
    std::filesystem::path log_dir_;

    std::mutex lifecycle_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> lifecycle_;
};

}  // namespace tooldock::process
