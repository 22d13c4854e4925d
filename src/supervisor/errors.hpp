#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace tooldock::supervisor {

enum class ErrorKind {
    kNone,
    kConfigurationError,
    kPortConflict,
    kLaunchFailure,
    kServerUnavailable,
    kCallFailure,
    kUnexpectedExit,
    kUnknownServer,
    kServerDisabled,
    kToolNotDeclared,
    kStopTimeout
};

const char* ToString(ErrorKind kind);

struct SupervisorError {
    ErrorKind kind = ErrorKind::kNone;
    std::string server;
    std::string tool;
    std::string message;
    // Captured stderr tail for launch failures, response body for call failures.
    std::string detail;

    bool Empty() const { return kind == ErrorKind::kNone; }
    std::string Describe() const;
};

SupervisorError MakeError(ErrorKind kind, const std::string& server, const std::string& message);

nlohmann::json ErrorToJson(const SupervisorError& error);

}  // namespace tooldock::supervisor
