#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "supervisor/supervisor.hpp"
#include "utils/common.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return tooldock::utils::GetHomePath() / ".tooldock" / "run.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

nlohmann::json AllStatusJson(const tooldock::supervisor::Supervisor& supervisor) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [name, report] : supervisor.GetAllStatus()) {
        json[name] = tooldock::supervisor::StatusToJson(report);
    }
    return json;
}

bool PrintLaunchResults(const std::map<std::string, tooldock::process::LaunchResult>& results) {
    bool all_ok = true;
    for (const auto& [name, result] : results) {
        if (result.ok) {
            std::cout << "  " << name << ": started on port " << result.process->Port()
                      << (result.already_running ? " (already running)" : "") << std::endl;
            continue;
        }
        all_ok = false;
        std::cout << "  " << name << ": " << result.error.Describe() << std::endl;
        if (!result.error.detail.empty()) {
            std::cout << "    " << result.error.detail << std::endl;
        }
    }
    return all_ok;
}

int ListCommand() {
    tooldock::supervisor::Supervisor supervisor(tooldock::config::LoadConfig());
    const auto load = supervisor.LoadDefinitions();
    std::cout << "Source: " << (load.used_defaults ? std::string("built-in defaults") : load.source.string())
              << std::endl;
    for (const auto& server : supervisor.ListServers()) {
        std::cout << "  " << server.name << "  command=" << server.command
                  << "  enabled=" << (server.enabled ? "true" : "false")
                  << "  port=" << supervisor.AssignedPort(server.name);
        if (!server.tools.empty()) {
            std::cout << "  tools=" << tooldock::utils::Join(server.tools, ",");
        }
        std::cout << std::endl;
    }
    return 0;
}

int CheckCommand() {
    tooldock::supervisor::Supervisor supervisor(tooldock::config::LoadConfig());
    supervisor.LoadDefinitions();
    std::cout << "Starting all servers..." << std::endl;
    const bool all_ok = PrintLaunchResults(supervisor.StartAllDetailed());
    std::cout << AllStatusJson(supervisor).dump(2) << std::endl;
    std::cout << "Stopping all servers..." << std::endl;
    for (const auto& [name, result] : supervisor.StopAllDetailed()) {
        if (!result.ok) {
            std::cout << "  " << name << ": " << result.error.Describe() << std::endl;
        }
    }
    return all_ok ? 0 : 1;
}

int CallCommand(const std::string& server, const std::string& tool, const std::string& raw_params) {
    auto params = nlohmann::json::object();
    if (!raw_params.empty()) {
        params = nlohmann::json::parse(raw_params, nullptr, false);
        if (params.is_discarded() || !params.is_object()) {
            std::cout << "params must be a JSON object" << std::endl;
            return 1;
        }
    }
    tooldock::supervisor::Supervisor supervisor(tooldock::config::LoadConfig());
    supervisor.LoadDefinitions();
    const auto result = supervisor.CallTool(server, tool, params);
    if (!result.ok) {
        std::cout << tooldock::supervisor::ErrorToJson(result.error).dump(2) << std::endl;
        return 1;
    }
    std::cout << result.payload.dump(2) << std::endl;
    return 0;
}

int RunCommand(const std::vector<std::string>& names) {
    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "tooldock already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write pid file." << std::endl;
        return 1;
    }

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    int exit_code = 0;
    {
        tooldock::supervisor::Supervisor supervisor(tooldock::config::LoadConfig());
        supervisor.LoadDefinitions();
        if (!PrintLaunchResults(supervisor.StartServers(names))) {
            exit_code = 1;
        }
        supervisor.StartMonitor();

        std::cout << "tooldock running. Press Ctrl+C to stop, send SIGHUP for status." << std::endl;
        while (true) {
            const int signal = g_signal;
            if (signal == SIGHUP) {
                g_signal = 0;
                std::cout << AllStatusJson(supervisor).dump(2) << std::endl;
            } else if (signal != 0) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "Stopping all servers..." << std::endl;
    }
    RemovePidFile();
    return exit_code;
}

int HupCommand() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "tooldock not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGHUP);
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: tooldock list | tooldock check | tooldock call <server> <tool> [json-params]"
              << " | tooldock run [name...] | tooldock hup" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "list") {
        return ListCommand();
    }
    if (command == "check") {
        return CheckCommand();
    }
    if (command == "call") {
        if (argc < 4) {
            PrintUsage();
            return 1;
        }
        return CallCommand(argv[2], argv[3], argc >= 5 ? argv[4] : "");
    }
    if (command == "run") {
        return RunCommand(std::vector<std::string>(argv + 2, argv + argc));
    }
    if (command == "hup") {
        return HupCommand();
    }
    PrintUsage();
    return 1;
}
