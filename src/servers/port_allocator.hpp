#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "supervisor/errors.hpp"

namespace tooldock::servers {

// True when something accepts TCP connections on host:port within timeout.
bool IsPortInUse(const std::string& host, int port, std::chrono::milliseconds timeout);

struct PortResult {
    bool ok = false;
    int port = 0;
    bool overridden = false;
    tooldock::supervisor::SupervisorError error;
};

class PortAllocator {
public:
    PortAllocator(std::string host,
                  int base_port,
                  int search_window,
                  std::chrono::milliseconds probe_timeout);

    // First pass: base_port + index in the given order. Clears previous overrides.
    std::unordered_map<std::string, int> Assign(const std::vector<std::string>& names);

    // Reserves a port for a launch. Tries the server's current port, then searches
    // upward within the window, skipping ports reserved by other servers and ports
    // that answer a connect-probe.
    PortResult Acquire(const std::string& name);
    void Release(const std::string& name, int port);

    // Current port for name (override if one was recorded); 0 when unassigned.
    int PortFor(const std::string& name) const;

private:
    std::string host_;
    int base_port_;
    int search_window_;
    std::chrono::milliseconds probe_timeout_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int> assigned_;
    std::unordered_map<std::string, int> overrides_;
    std::unordered_map<int, std::string> reserved_;
};

}  // namespace tooldock::servers
