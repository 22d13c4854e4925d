#include "supervisor/errors.hpp"

namespace tooldock::supervisor {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "None";
        case ErrorKind::kConfigurationError: return "ConfigurationError";
        case ErrorKind::kPortConflict: return "PortConflict";
        case ErrorKind::kLaunchFailure: return "LaunchFailure";
        case ErrorKind::kServerUnavailable: return "ServerUnavailable";
        case ErrorKind::kCallFailure: return "CallFailure";
        case ErrorKind::kUnexpectedExit: return "UnexpectedExit";
        case ErrorKind::kUnknownServer: return "UnknownServer";
        case ErrorKind::kServerDisabled: return "ServerDisabled";
        case ErrorKind::kToolNotDeclared: return "ToolNotDeclared";
        case ErrorKind::kStopTimeout: return "StopTimeout";
    }
    return "Unknown";
}

std::string SupervisorError::Describe() const {
    std::string text = ToString(kind);
    if (!server.empty()) {
        text += " server=" + server;
    }
    if (!tool.empty()) {
        text += " tool=" + tool;
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

SupervisorError MakeError(ErrorKind kind, const std::string& server, const std::string& message) {
    SupervisorError error{};
    error.kind = kind;
    error.server = server;
    error.message = message;
    return error;
}

nlohmann::json ErrorToJson(const SupervisorError& error) {
    nlohmann::json json = {
        {"kind", ToString(error.kind)},
        {"server", error.server},
        {"message", error.message}
    };
    json["tool"] = error.tool.empty() ? nlohmann::json(nullptr) : nlohmann::json(error.tool);
    json["detail"] = error.detail.empty() ? nlohmann::json(nullptr) : nlohmann::json(error.detail);
    return json;
}

}  // namespace tooldock::supervisor
