#include "router/call_router.hpp"

#include "httplib.h"
#include "utils/logging.hpp"

namespace tooldock::router {

using tooldock::supervisor::ErrorKind;
using tooldock::supervisor::MakeError;

namespace {

constexpr std::size_t kBodyDetailLimit = 1024;

std::string Truncate(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

void SetTimeoutMs(httplib::Client& client, int connect_ms, int read_ms) {
    client.set_connection_timeout(connect_ms / 1000, (connect_ms % 1000) * 1000);
    client.set_read_timeout(read_ms / 1000, (read_ms % 1000) * 1000);
    client.set_write_timeout(read_ms / 1000, (read_ms % 1000) * 1000);
}

}  // namespace

CallRouter::CallRouter(const tooldock::config::SupervisorConfig& config,
                       tooldock::servers::Registry& registry,
                       tooldock::process::ProcessLauncher& launcher)
    : config_(config)
    , registry_(registry)
    , launcher_(launcher) {}

CallResult CallRouter::Invoke(const std::string& server,
                              const std::string& tool,
                              const nlohmann::json& params) {
    CallResult result{};
    const auto def = registry_.FindDefinition(server);
    if (!def) {
        result.error = MakeError(ErrorKind::kUnknownServer, server, "server is not configured");
        result.error.tool = tool;
        return result;
    }
    if (!def->enabled) {
        result.error = MakeError(ErrorKind::kServerDisabled, server, "server is disabled");
        result.error.tool = tool;
        return result;
    }
    if (!def->declared_tools.empty() && def->declared_tools.count(tool) == 0) {
        result.error = MakeError(ErrorKind::kToolNotDeclared, server, "tool is not declared by this server");
        result.error.tool = tool;
        return result;
    }

    auto process = registry_.FindActive(server);
    if (!process) {
        tooldock::utils::LogInfo("router", server + " not running; starting on demand");
        auto launched = launcher_.Start(server);
        if (!launched.ok) {
            result.error = MakeError(ErrorKind::kServerUnavailable, server,
                                     "could not start server: " + launched.error.message);
            result.error.tool = tool;
            result.error.detail = launched.error.detail.empty()
                ? std::string(tooldock::supervisor::ToString(launched.error.kind))
                : launched.error.detail;
            tooldock::utils::LogError("router", result.error.Describe());
            return result;
        }
        process = launched.process;
    }
    return Post(server, tool, process->Port(), params);
}

CallResult CallRouter::Post(const std::string& server,
                            const std::string& tool,
                            int port,
                            const nlohmann::json& params) const {
    CallResult result{};
    auto fail = [&](const std::string& message, const std::string& detail) {
        result.error = MakeError(ErrorKind::kCallFailure, server, message);
        result.error.tool = tool;
        result.error.detail = detail;
        tooldock::utils::LogError("router", result.error.Describe());
        return result;
    };

    httplib::Client client(config_.host, port);
    SetTimeoutMs(client, config_.timeouts.call_connect_timeout_ms, config_.timeouts.call_timeout_ms);

    nlohmann::json body{{"method", tool}, {"params", params.is_null() ? nlohmann::json::object() : params}};
    tooldock::utils::LogDebug("router", "POST " + config_.host + ":" + std::to_string(port) +
                              config_.tool_path + " method=" + tool);
    auto response = client.Post(config_.tool_path, body.dump(), "application/json");
    if (!response) {
        return fail("request failed: " + httplib::to_string(response.error()), {});
    }
    if (response->status < 200 || response->status >= 300) {
        return fail("HTTP " + std::to_string(response->status), Truncate(response->body, kBodyDetailLimit));
    }

    auto payload = nlohmann::json::parse(response->body, nullptr, false);
    if (payload.is_discarded()) {
        return fail("response is not valid JSON", Truncate(response->body, kBodyDetailLimit));
    }
    result.ok = true;
    result.payload = std::move(payload);
    return result;
}

}  // namespace tooldock::router
