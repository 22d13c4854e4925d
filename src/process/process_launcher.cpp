#include "process/process_launcher.hpp"

#include <boost/process/v1.hpp>
#include <set>
#include <signal.h>
#include <thread>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tooldock::process {
namespace bp = boost::process::v1;

using tooldock::supervisor::ErrorKind;
using tooldock::supervisor::MakeError;

namespace {

std::string ExitCodeText(const std::optional<int>& code) {
    return code.has_value() ? std::to_string(*code) : std::string("unknown");
}

}  // namespace

ProcessLauncher::ProcessLauncher(const tooldock::config::SupervisorConfig& config,
                                 tooldock::servers::Registry& registry,
                                 tooldock::servers::PortAllocator& ports)
    : config_(config)
    , registry_(registry)
    , ports_(ports)
    , log_dir_(tooldock::utils::ExpandHome(config.log_dir)) {}

std::mutex& ProcessLauncher::LifecycleMutex(const std::string& name) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    auto& slot = lifecycle_[name];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

LaunchResult ProcessLauncher::Start(const std::string& name) {
    LaunchResult result{};
    const auto def = registry_.FindDefinition(name);
    if (!def) {
        result.error = MakeError(ErrorKind::kUnknownServer, name, "server is not configured");
        return result;
    }
    if (!def->enabled) {
        result.error = MakeError(ErrorKind::kServerDisabled, name, "server is disabled");
        return result;
    }

    std::lock_guard<std::mutex> lock(LifecycleMutex(name));
    auto existing = registry_.FindActive(name);
    if (existing && !existing->Child().Poll()) {
        // Exited since the monitor's last pass; reconcile here and launch afresh.
        const auto code = existing->Child().ExitCode();
        if (registry_.RemoveActiveIf(name, existing.get())) {
            existing->CloseLogs();
            existing->SetStatus(ServerStatus::kCrashed);
            ports_.Release(name, existing->Port());
            registry_.SetStatus(name, ServerStatus::kCrashed, existing->Port(), code);
            tooldock::utils::LogWarn("launcher", name + " exited unexpectedly exit=" + ExitCodeText(code) +
                                     "; relaunching");
        }
        existing.reset();
    }
    if (existing) {
        tooldock::utils::LogDebug("launcher", name + " already running pid=" +
                                  std::to_string(existing->Child().Pid()));
        result.ok = true;
        result.already_running = true;
        result.process = std::move(existing);
        return result;
    }
    return Spawn(def);
}

LaunchResult ProcessLauncher::Spawn(const std::shared_ptr<const tooldock::servers::ServerDefinition>& def) {
    const auto& name = def->name;
    LaunchResult result{};
    registry_.SetStatus(name, ServerStatus::kStarting);

    const auto port = ports_.Acquire(name);
    if (!port.ok) {
        registry_.SetStatus(name, ServerStatus::kStopped);
        result.error = port.error;
        return result;
    }

    auto fail = [&](const std::string& message, const std::string& detail, std::optional<int> code) {
        ports_.Release(name, port.port);
        registry_.SetStatus(name, ServerStatus::kStopped, port.port, code);
        result.error = MakeError(ErrorKind::kLaunchFailure, name, message);
        result.error.detail = detail;
        tooldock::utils::LogError("launcher", "failed to start " + name + ": " + message);
        return result;
    };

    LogFiles logs;
    std::string log_error;
    if (!logs.Open(log_dir_, name, &log_error)) {
        return fail(log_error, {}, std::nullopt);
    }

    std::string exe = def->command;
    if (exe.find('/') == std::string::npos) {
        const auto found = bp::search_path(exe);
        if (found.empty()) {
            return fail("command not found: " + exe, {}, std::nullopt);
        }
        exe = found.string();
    }

    bp::environment env = boost::this_process::environment();
    env["PORT"] = std::to_string(port.port);
    for (const auto& [key, value] : def->env) {
        if (!value.empty()) {
            env[key] = value;
        }
    }

    std::shared_ptr<ChildHandle> child;
    try {
        bp::child child_process(
            bp::exe = exe,
            bp::args = def->args,
            env,
            bp::std_in < bp::null,
            bp::std_out > logs.out.get(),
            bp::std_err > logs.err.get());
        child = std::make_shared<ChildHandle>(child_process.id());
        child_process.detach();
    } catch (const bp::process_error& ex) {
        return fail(std::string("spawn failed: ") + ex.what(), {}, std::nullopt);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.timeouts.launch_grace_ms));
    if (!child->Poll()) {
        const auto code = child->ExitCode();
        logs.Close();
        const auto tail = ReadTail(logs.err_path, config_.stderr_tail_bytes);
        return fail("exited during launch (code " + ExitCodeText(code) + ")", tail, code);
    }

    if (!WaitUntilReady(*child, port.port)) {
        const auto code = child->ExitCode();
        logs.Close();
        const auto tail = ReadTail(logs.err_path, config_.stderr_tail_bytes);
        return fail("exited before accepting connections (code " + ExitCodeText(code) + ")", tail, code);
    }

    auto process = std::make_shared<ServerProcess>(def, child, port.port, std::move(logs));
    process->SetStatus(ServerStatus::kRunning);
    if (!registry_.InsertActive(name, process)) {
        child->Signal(SIGKILL);
        child->WaitForExit(std::chrono::milliseconds(config_.timeouts.kill_timeout_ms));
        return fail("server was registered concurrently", {}, child->ExitCode());
    }
    registry_.SetStatus(name, ServerStatus::kRunning, port.port);
    tooldock::utils::LogInfo("launcher", "started " + name + " pid=" + std::to_string(child->Pid()) +
                             " port=" + std::to_string(port.port));
    result.ok = true;
    result.process = std::move(process);
    return result;
}

bool ProcessLauncher::WaitUntilReady(ChildHandle& child, int port) const {
    if (config_.timeouts.ready_timeout_ms <= 0) {
        return true;
    }
    const auto probe = std::chrono::milliseconds(config_.timeouts.probe_timeout_ms);
    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::milliseconds(config_.timeouts.ready_timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child.Poll()) {
            return false;
        }
        if (tooldock::servers::IsPortInUse(config_.host, port, probe)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    // Some tool servers never listen; they stay registered once past the grace window.
    tooldock::utils::LogWarn("launcher", "pid " + std::to_string(child.Pid()) +
                             " not accepting on port " + std::to_string(port) + " yet");
    return child.Poll();
}

StopResult ProcessLauncher::Stop(const std::string& name) {
    std::lock_guard<std::mutex> lock(LifecycleMutex(name));
    StopResult result{};
    auto process = registry_.FindActive(name);
    if (!process) {
        result.ok = true;
        return result;
    }
    result.was_running = true;

    auto& child = process->Child();
    process->RequestStop();
    child.Signal(SIGTERM);
    if (!child.WaitForExit(std::chrono::milliseconds(config_.timeouts.stop_timeout_ms))) {
        tooldock::utils::LogWarn("launcher", name + " ignored SIGTERM; sending SIGKILL");
        child.Signal(SIGKILL);
        result.forced = true;
        child.WaitForExit(std::chrono::milliseconds(config_.timeouts.kill_timeout_ms));
    }
    result.exit_code = child.ExitCode();

    process->CloseLogs();
    if (registry_.RemoveActiveIf(name, process.get())) {
        ports_.Release(name, process->Port());
    }
    process->SetStatus(ServerStatus::kStopped);
    registry_.SetStatus(name, ServerStatus::kStopped, process->Port(), result.exit_code);

    if (!child.HasExited()) {
        result.error = MakeError(ErrorKind::kStopTimeout, name,
                                 "pid " + std::to_string(child.Pid()) + " survived SIGKILL");
        tooldock::utils::LogError("launcher", result.error.Describe());
        return result;
    }
    tooldock::utils::LogInfo("launcher", "stopped " + name + " exit=" + ExitCodeText(result.exit_code) +
                             (result.forced ? " (killed)" : ""));
    result.ok = true;
    return result;
}

LaunchResult ProcessLauncher::Restart(const std::string& name) {
    const auto stopped = Stop(name);
    if (!stopped.ok) {
        LaunchResult result{};
        result.error = stopped.error;
        return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.timeouts.restart_delay_ms));
    return Start(name);
}

std::map<std::string, LaunchResult> ProcessLauncher::StartAll() {
    std::map<std::string, LaunchResult> results;
    for (const auto& name : registry_.Names()) {
        results[name] = Start(name);
    }
    return results;
}

std::map<std::string, StopResult> ProcessLauncher::StopAll() {
    std::set<std::string> names;
    for (const auto& name : registry_.Names()) {
        names.insert(name);
    }
    for (const auto& [name, _] : registry_.ActiveSnapshot()) {
        names.insert(name);
    }
    std::map<std::string, StopResult> results;
    for (const auto& name : names) {
        results[name] = Stop(name);
    }
    return results;
}

}  // namespace tooldock::process
