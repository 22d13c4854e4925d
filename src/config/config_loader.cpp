#include "config/config_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tooldock::config {
namespace {

using tooldock::utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

void ApplyInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyConfigFromJson(SupervisorConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ApplyString(data, "host", config.host);
    ApplyInt(data, "basePort", config.base_port);
    ApplyInt(data, "portSearchWindow", config.port_search_window);
    ApplyString(data, "logDir", config.log_dir);
    ApplyInt(data, "healthIntervalMs", config.health_interval_ms);
    ApplyString(data, "toolPath", config.tool_path);

    if (data.contains("stderrTailBytes") && data["stderrTailBytes"].is_number_unsigned()) {
        config.stderr_tail_bytes = data["stderrTailBytes"].get<std::size_t>();
    }

    if (data.contains("serverConfigPaths") && data["serverConfigPaths"].is_array()) {
        config.server_config_paths.clear();
        for (const auto& item : data["serverConfigPaths"]) {
            if (item.is_string()) {
                config.server_config_paths.push_back(item.get<std::string>());
            }
        }
    }

    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        const auto level = tooldock::utils::ParseLogLevel(data["logLevel"].get<std::string>());
        if (level.has_value()) {
            config.log_level = *level;
        }
    }

    ApplyInt(data, "launchGraceMs", config.timeouts.launch_grace_ms);
    ApplyInt(data, "readyTimeoutMs", config.timeouts.ready_timeout_ms);
    ApplyInt(data, "stopTimeoutMs", config.timeouts.stop_timeout_ms);
    ApplyInt(data, "killTimeoutMs", config.timeouts.kill_timeout_ms);
    ApplyInt(data, "restartDelayMs", config.timeouts.restart_delay_ms);
    ApplyInt(data, "callConnectTimeoutMs", config.timeouts.call_connect_timeout_ms);
    ApplyInt(data, "callTimeoutMs", config.timeouts.call_timeout_ms);
    ApplyInt(data, "probeTimeoutMs", config.timeouts.probe_timeout_ms);
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ':')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyIntEnv(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void RequirePositive(const char* key, int fallback, int& target) {
    if (target <= 0) {
        tooldock::utils::LogWarn("config", std::string(key) + "=" + std::to_string(target) +
                                 " must be positive; using " + std::to_string(fallback));
        target = fallback;
    }
}

// Out-of-range values fall back to the built-in defaults.
void ValidateConfig(SupervisorConfig& config) {
    const SupervisorConfig defaults{};
    if (config.base_port <= 0 || config.base_port > 65535) {
        tooldock::utils::LogWarn("config", "basePort=" + std::to_string(config.base_port) +
                                 " is not a valid port; using " + std::to_string(defaults.base_port));
        config.base_port = defaults.base_port;
    }
    RequirePositive("portSearchWindow", defaults.port_search_window, config.port_search_window);
    RequirePositive("healthIntervalMs", defaults.health_interval_ms, config.health_interval_ms);
    RequirePositive("stopTimeoutMs", defaults.timeouts.stop_timeout_ms, config.timeouts.stop_timeout_ms);
    RequirePositive("killTimeoutMs", defaults.timeouts.kill_timeout_ms, config.timeouts.kill_timeout_ms);
    RequirePositive("callConnectTimeoutMs", defaults.timeouts.call_connect_timeout_ms,
                    config.timeouts.call_connect_timeout_ms);
    RequirePositive("callTimeoutMs", defaults.timeouts.call_timeout_ms, config.timeouts.call_timeout_ms);
    RequirePositive("probeTimeoutMs", defaults.timeouts.probe_timeout_ms, config.timeouts.probe_timeout_ms);
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return tooldock::utils::GetHomePath() / ".tooldock" / "config.json";
}

SupervisorConfig LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

SupervisorConfig LoadConfig(const std::filesystem::path& config_path) {
    SupervisorConfig config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        std::ostringstream buffer;
        buffer << input.rdbuf();
        const auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            tooldock::utils::LogWarn("config", "ignoring malformed " + config_path.string() + "; using defaults");
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    const auto host = GetEnvFallback("TOOLDOCK_HOST", "TOOLDOCK_SUPERVISOR_HOST");
    if (!host.empty()) {
        config.host = host;
    }

    ApplyIntEnv("TOOLDOCK_BASE_PORT", "TOOLDOCK_PORT_BASE", config.base_port);
    ApplyIntEnv("TOOLDOCK_PORT_SEARCH_WINDOW", "TOOLDOCK_PORT_WINDOW", config.port_search_window);

    const auto log_dir = GetEnvFallback("TOOLDOCK_LOG_DIR", "TOOLDOCK_LOGS");
    if (!log_dir.empty()) {
        config.log_dir = log_dir;
    }

    const auto server_paths = GetEnvFallback("TOOLDOCK_SERVER_CONFIG_PATHS", "TOOLDOCK_SERVERS");
    if (!server_paths.empty()) {
        config.server_config_paths = SplitList(server_paths);
    }

    ApplyIntEnv("TOOLDOCK_HEALTH__INTERVAL_MS", "TOOLDOCK_HEALTH_INTERVAL_MS", config.health_interval_ms);
    ApplyIntEnv("TOOLDOCK_TIMEOUTS__LAUNCH_GRACE_MS", "TOOLDOCK_LAUNCH_GRACE_MS",
                config.timeouts.launch_grace_ms);
    ApplyIntEnv("TOOLDOCK_TIMEOUTS__STOP_MS", "TOOLDOCK_STOP_TIMEOUT_MS", config.timeouts.stop_timeout_ms);
    ApplyIntEnv("TOOLDOCK_TIMEOUTS__CALL_MS", "TOOLDOCK_CALL_TIMEOUT_MS", config.timeouts.call_timeout_ms);

    const auto tool_path = GetEnvFallback("TOOLDOCK_TOOL_PATH", "TOOLDOCK_RPC_PATH");
    if (!tool_path.empty()) {
        config.tool_path = tool_path;
    }

    const auto log_level = GetEnvFallback("TOOLDOCK_LOG_LEVEL", "TOOLDOCK_LOGLEVEL");
    if (!log_level.empty()) {
        const auto level = tooldock::utils::ParseLogLevel(log_level);
        if (level.has_value()) {
            config.log_level = *level;
        } else {
            tooldock::utils::LogWarn("config", "unknown log level '" + log_level + "'");
        }
    }

    ValidateConfig(config);
    return config;
}

}  // namespace tooldock::config
