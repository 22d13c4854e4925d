#include "supervisor/supervisor.hpp"

#include <set>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tooldock::supervisor {

using tooldock::process::ServerStatus;

namespace {

std::vector<std::string> SortedTools(const tooldock::servers::ServerDefinition& def) {
    return std::vector<std::string>(def.declared_tools.begin(), def.declared_tools.end());
}

}  // namespace

nlohmann::json StatusToJson(const ServerStatusReport& report) {
    nlohmann::json json = {
        {"running", report.running},
        {"status", tooldock::process::ToString(report.status)},
        {"port", report.port},
        {"pid", report.pid},
        {"uptime", report.uptime.count()},
        {"health", report.health},
        {"tools", report.tools}
    };
    json["lastExitCode"] = report.last_exit_code ? nlohmann::json(*report.last_exit_code)
                                                 : nlohmann::json(nullptr);
    return json;
}

Supervisor::Supervisor(const tooldock::config::SupervisorConfig& config)
    : config_(config)
    , ports_(config.host,
             config.base_port,
             config.port_search_window,
             std::chrono::milliseconds(config.timeouts.probe_timeout_ms))
    , launcher_(config_, registry_, ports_)
    , router_(config_, registry_, launcher_)
    , monitor_(registry_, ports_, std::chrono::milliseconds(config.health_interval_ms)) {
    tooldock::utils::SetLogConfig({config.log_level});
    for (const auto& path : config_.server_config_paths) {
        candidates_.push_back(tooldock::utils::ExpandHome(path));
    }
}

Supervisor::~Supervisor() {
    StopMonitor();
    // Callers' listeners may capture state that is already gone.
    registry_.SetStatusListener({});
    if (registry_.ActiveCount() > 0) {
        tooldock::utils::LogInfo("supervisor", "shutting down " + std::to_string(registry_.ActiveCount()) +
                                 " server(s)");
    }
    launcher_.StopAll();
}

tooldock::servers::LoadResult Supervisor::LoadDefinitions() {
    return LoadDefinitions(candidates_);
}

tooldock::servers::LoadResult Supervisor::LoadDefinitions(const std::vector<std::filesystem::path>& candidates) {
    candidates_ = candidates;
    auto result = tooldock::servers::LoadDefinitions(candidates_);
    ApplyDefinitions(result.definitions);
    last_load_ = std::move(result);
    return last_load_;
}

void Supervisor::SetDefinitions(std::vector<tooldock::servers::ServerDefinition> definitions) {
    last_load_ = {};
    last_load_.definitions = definitions;
    ApplyDefinitions(std::move(definitions));
}

tooldock::servers::LoadResult Supervisor::Reload() {
    tooldock::utils::LogInfo("supervisor", "reloading definitions");
    return LoadDefinitions(candidates_);
}

void Supervisor::ApplyDefinitions(std::vector<tooldock::servers::ServerDefinition> definitions) {
    registry_.ReplaceDefinitions(std::move(definitions));
    const auto names = registry_.Names();
    ports_.Assign(names);

    const std::set<std::string> kept(names.begin(), names.end());
    for (const auto& [name, _] : registry_.ActiveSnapshot()) {
        if (kept.count(name) == 0) {
            tooldock::utils::LogInfo("supervisor", name + " no longer configured; stopping");
            launcher_.Stop(name);
        }
    }
}

std::vector<ServerSummary> Supervisor::ListServers() const {
    std::vector<ServerSummary> servers;
    for (const auto& def : registry_.Definitions()) {
        servers.push_back({def->name, def->command, def->enabled, SortedTools(*def)});
    }
    return servers;
}

bool Supervisor::StartServer(const std::string& name) {
    return Start(name).ok;
}

bool Supervisor::StopServer(const std::string& name) {
    return Stop(name).ok;
}

bool Supervisor::RestartServer(const std::string& name) {
    return Restart(name).ok;
}

tooldock::process::LaunchResult Supervisor::Start(const std::string& name) {
    return launcher_.Start(name);
}

tooldock::process::StopResult Supervisor::Stop(const std::string& name) {
    return launcher_.Stop(name);
}

tooldock::process::LaunchResult Supervisor::Restart(const std::string& name) {
    return launcher_.Restart(name);
}

std::map<std::string, bool> Supervisor::StartAll() {
    std::map<std::string, bool> results;
    for (const auto& [name, result] : StartAllDetailed()) {
        results[name] = result.ok;
    }
    return results;
}

std::map<std::string, bool> Supervisor::StopAll() {
    std::map<std::string, bool> results;
    for (const auto& [name, result] : StopAllDetailed()) {
        results[name] = result.ok;
    }
    return results;
}

std::map<std::string, tooldock::process::LaunchResult> Supervisor::StartAllDetailed() {
    return launcher_.StartAll();
}

std::map<std::string, tooldock::process::StopResult> Supervisor::StopAllDetailed() {
    return launcher_.StopAll();
}

std::map<std::string, tooldock::process::LaunchResult> Supervisor::StartServers(const std::vector<std::string>& names) {
    if (names.empty()) {
        return launcher_.StartAll();
    }
    std::map<std::string, tooldock::process::LaunchResult> results;
    for (const auto& name : names) {
        results[name] = launcher_.Start(name);
    }
    return results;
}

std::optional<ServerStatusReport> Supervisor::GetStatus(const std::string& name) const {
    const auto def = registry_.FindDefinition(name);
    const auto process = registry_.FindActive(name);
    if (!def && !process) {
        return std::nullopt;
    }
    const auto record = registry_.Record(name);

    ServerStatusReport report{};
    report.name = name;
    report.last_exit_code = record.last_exit_code;
    report.tools = def ? SortedTools(*def) : SortedTools(process->Definition());
    if (process) {
        report.running = true;
        report.status = process->Status();
        report.port = process->Port();
        report.pid = static_cast<int>(process->Child().Pid());
        report.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            tooldock::utils::Now() - process->StartedAt());
        report.health = "healthy";
        return report;
    }
    report.status = record.status;
    report.port = record.port > 0 ? record.port : ports_.PortFor(name);
    report.health = tooldock::process::ToString(record.status);
    return report;
}

std::map<std::string, ServerStatusReport> Supervisor::GetAllStatus() const {
    std::map<std::string, ServerStatusReport> all;
    for (const auto& name : registry_.Names()) {
        if (auto report = GetStatus(name)) {
            all.emplace(name, std::move(*report));
        }
    }
    return all;
}

tooldock::router::CallResult Supervisor::CallTool(const std::string& server,
                                                  const std::string& tool,
                                                  const nlohmann::json& params) {
    return router_.Invoke(server, tool, params);
}

std::vector<std::string> Supervisor::ListTools(const std::string& name) const {
    const auto def = registry_.FindDefinition(name);
    if (!def) {
        return {};
    }
    return SortedTools(*def);
}

void Supervisor::SetStatusListener(tooldock::servers::Registry::StatusListener listener) {
    registry_.SetStatusListener(std::move(listener));
}

void Supervisor::StartMonitor() {
    monitor_.Start();
}

void Supervisor::StopMonitor() {
    monitor_.Stop();
}

std::vector<tooldock::monitor::ReapedServer> Supervisor::CheckHealth() {
    return monitor_.CheckNow();
}

}  // namespace tooldock::supervisor
