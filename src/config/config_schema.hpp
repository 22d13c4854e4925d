#pragma once

#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace tooldock::config {

struct TimeoutsConfig {
    int launch_grace_ms = 1000;
    int ready_timeout_ms = 3000;
    int stop_timeout_ms = 5000;
    int kill_timeout_ms = 2000;
    int restart_delay_ms = 500;
    int call_connect_timeout_ms = 2000;
    int call_timeout_ms = 10000;
    int probe_timeout_ms = 200;
};

struct SupervisorConfig {
    std::string host = "127.0.0.1";
    int base_port = 3001;
    int port_search_window = 100;
    std::string log_dir = "~/.tooldock/logs";
    std::vector<std::string> server_config_paths = {
        "~/.tooldock/servers.json",
        "~/.mcp/config.json",
        "~/.docker/mcp-toolkit/config.json",
        "./mcp_config.json"
    };
    int health_interval_ms = 10000;
    TimeoutsConfig timeouts;
    std::string tool_path = "/tool";
    std::size_t stderr_tail_bytes = 2048;
    tooldock::utils::LogLevel log_level = tooldock::utils::LogLevel::kInfo;
};

}  // namespace tooldock::config
