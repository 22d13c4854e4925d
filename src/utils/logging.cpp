#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace tooldock::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config;
    return config;
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (level < MutableConfig().min_level) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace tooldock::utils
