#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "process/process_launcher.hpp"
#include "servers/registry.hpp"
#include "supervisor/errors.hpp"

namespace tooldock::router {

struct CallResult {
    bool ok = false;
    // The server's deserialized response body, untouched.
    nlohmann::json payload;
    tooldock::supervisor::SupervisorError error;
};

// Forwards (server, tool, params) to the server's local HTTP endpoint,
// starting the server first when it is not active. Never retries.
class CallRouter {
public:
    CallRouter(const tooldock::config::SupervisorConfig& config,
               tooldock::servers::Registry& registry,
               tooldock::process::ProcessLauncher& launcher);

    CallResult Invoke(const std::string& server,
                      const std::string& tool,
                      const nlohmann::json& params);

private:
    CallResult Post(const std::string& server,
                    const std::string& tool,
                    int port,
                    const nlohmann::json& params) const;

    tooldock::config::SupervisorConfig config_;
    tooldock::servers::Registry& registry_;
    tooldock::process::ProcessLauncher& launcher_;
};

}  // namespace tooldock::router
