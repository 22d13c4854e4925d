#include "servers/port_allocator.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

#include "utils/logging.hpp"

namespace tooldock::servers {
namespace {

constexpr int kMaxPort = 65535;

bool ConnectWithTimeout(const addrinfo* addr, std::chrono::milliseconds timeout) {
    const int fd = ::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
    if (fd < 0) {
        return false;
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool connected = false;
    const int rc = ::connect(fd, addr->ai_addr, addr->ai_addrlen);
    if (rc == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                connected = true;
            }
        }
    }
    ::close(fd);
    return connected;
}

}  // namespace

bool IsPortInUse(const std::string& host, int port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const auto service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &results) != 0 || !results) {
        return false;
    }
    bool in_use = false;
    for (const addrinfo* addr = results; addr && !in_use; addr = addr->ai_next) {
        in_use = ConnectWithTimeout(addr, timeout);
    }
    ::freeaddrinfo(results);
    return in_use;
}

PortAllocator::PortAllocator(std::string host,
                             int base_port,
                             int search_window,
                             std::chrono::milliseconds probe_timeout)
    : host_(std::move(host))
    , base_port_(base_port)
    , search_window_(search_window > 0 ? search_window : 1)
    , probe_timeout_(probe_timeout) {}

std::unordered_map<std::string, int> PortAllocator::Assign(const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);
    assigned_.clear();
    overrides_.clear();
    for (std::size_t i = 0; i < names.size(); ++i) {
        assigned_[names[i]] = base_port_ + static_cast<int>(i);
    }
    return assigned_;
}

PortResult PortAllocator::Acquire(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assigned_.find(name);
    if (it == assigned_.end()) {
        it = assigned_.emplace(name, base_port_ + static_cast<int>(assigned_.size())).first;
    }
    const int preferred = it->second;

    for (int offset = 0; offset < search_window_; ++offset) {
        const int port = preferred + offset;
        if (port > kMaxPort) {
            break;
        }
        const auto owner = reserved_.find(port);
        if (owner != reserved_.end() && owner->second != name) {
            continue;
        }
        if (IsPortInUse(host_, port, probe_timeout_)) {
            tooldock::utils::LogDebug("ports", "port " + std::to_string(port) + " busy for " + name);
            continue;
        }
        reserved_[port] = name;
        PortResult result{};
        result.ok = true;
        result.port = port;
        result.overridden = port != preferred;
        if (result.overridden) {
            overrides_[name] = port;
            tooldock::utils::LogInfo("ports", name + " reassigned " + std::to_string(preferred) +
                                     " -> " + std::to_string(port));
        } else {
            overrides_.erase(name);
        }
        return result;
    }

    PortResult result{};
    result.error.kind = tooldock::supervisor::ErrorKind::kPortConflict;
    result.error.server = name;
    result.error.message = "no free port in [" + std::to_string(preferred) + ", " +
        std::to_string(preferred + search_window_ - 1) + "]";
    tooldock::utils::LogError("ports", name + ": " + result.error.message);
    return result;
}

void PortAllocator::Release(const std::string& name, int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = reserved_.find(port);
    if (it != reserved_.end() && it->second == name) {
        reserved_.erase(it);
    }
}

int PortAllocator::PortFor(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto override_it = overrides_.find(name);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }
    const auto it = assigned_.find(name);
    return it == assigned_.end() ? 0 : it->second;
}

}  // namespace tooldock::servers
