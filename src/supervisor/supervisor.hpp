#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "monitor/health_monitor.hpp"
#include "nlohmann/json.hpp"
#include "process/process_launcher.hpp"
#include "router/call_router.hpp"
#include "servers/definition_store.hpp"
#include "servers/port_allocator.hpp"
#include "servers/registry.hpp"

namespace tooldock::supervisor {

struct ServerSummary {
    std::string name;
    std::string command;
    bool enabled = true;
    std::vector<std::string> tools;
};

struct ServerStatusReport {
    std::string name;
    bool running = false;
    tooldock::process::ServerStatus status = tooldock::process::ServerStatus::kStopped;
    int port = 0;
    int pid = 0;
    std::chrono::milliseconds uptime{0};
    std::optional<int> last_exit_code;
    std::string health;
    std::vector<std::string> tools;
};

nlohmann::json StatusToJson(const ServerStatusReport& report);

// Owns one isolated set of definitions, ports, children and the monitor
// thread. Destroying it stops the monitor and every server it launched.
class Supervisor {
public:
    explicit Supervisor(const tooldock::config::SupervisorConfig& config);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Loads from config.server_config_paths (first usable source wins).
    tooldock::servers::LoadResult LoadDefinitions();
    tooldock::servers::LoadResult LoadDefinitions(const std::vector<std::filesystem::path>& candidates);
    // Installs definitions directly. Active servers missing from the new set are stopped.
    void SetDefinitions(std::vector<tooldock::servers::ServerDefinition> definitions);
    // Re-reads the last candidate list.
    tooldock::servers::LoadResult Reload();
    const tooldock::servers::LoadResult& LastLoad() const { return last_load_; }

    std::vector<ServerSummary> ListServers() const;

    bool StartServer(const std::string& name);
    bool StopServer(const std::string& name);
    bool RestartServer(const std::string& name);
    tooldock::process::LaunchResult Start(const std::string& name);
    tooldock::process::StopResult Stop(const std::string& name);
    tooldock::process::LaunchResult Restart(const std::string& name);

    std::map<std::string, bool> StartAll();
    std::map<std::string, bool> StopAll();
    std::map<std::string, tooldock::process::LaunchResult> StartAllDetailed();
    std::map<std::string, tooldock::process::StopResult> StopAllDetailed();
    // Starts the named servers, or every server when names is empty.
    std::map<std::string, tooldock::process::LaunchResult> StartServers(const std::vector<std::string>& names);

    std::optional<ServerStatusReport> GetStatus(const std::string& name) const;
    std::map<std::string, ServerStatusReport> GetAllStatus() const;

    tooldock::router::CallResult CallTool(const std::string& server,
                                          const std::string& tool,
                                          const nlohmann::json& params);
    std::vector<std::string> ListTools(const std::string& name) const;

    // Invoked on every status transition, outside the registry lock.
    void SetStatusListener(tooldock::servers::Registry::StatusListener listener);

    void StartMonitor();
    void StopMonitor();
    std::vector<tooldock::monitor::ReapedServer> CheckHealth();

    const tooldock::config::SupervisorConfig& Config() const { return config_; }
    int AssignedPort(const std::string& name) const { return ports_.PortFor(name); }

private:
    void ApplyDefinitions(std::vector<tooldock::servers::ServerDefinition> definitions);

    tooldock::config::SupervisorConfig config_;
    tooldock::servers::Registry registry_;
    tooldock::servers::PortAllocator ports_;
    tooldock::process::ProcessLauncher launcher_;
    tooldock::router::CallRouter router_;
    tooldock::monitor::HealthMonitor monitor_;

    std::vector<std::filesystem::path> candidates_;
    tooldock::servers::LoadResult last_load_;
};

}  // namespace tooldock::supervisor
