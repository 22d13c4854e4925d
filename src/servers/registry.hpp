#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "process/server_process.hpp"
#include "servers/server_definition.hpp"

namespace tooldock::servers {

struct StatusRecord {
    tooldock::process::ServerStatus status = tooldock::process::ServerStatus::kStopped;
    int port = 0;
    std::optional<int> last_exit_code;
};

// Definitions (replaced wholesale on reload) and the active process table.
// Every mutation of the active table happens under one mutex.
class Registry {
public:
    using DefinitionPtr = std::shared_ptr<const ServerDefinition>;
    using ProcessPtr = std::shared_ptr<tooldock::process::ServerProcess>;
    using StatusListener = std::function<void(const std::string&, tooldock::process::ServerStatus)>;

    void ReplaceDefinitions(std::vector<ServerDefinition> definitions);
    std::vector<DefinitionPtr> Definitions() const;
    std::vector<std::string> Names() const;
    DefinitionPtr FindDefinition(const std::string& name) const;

    ProcessPtr FindActive(const std::string& name) const;
    // False when name already has an active entry.
    bool InsertActive(const std::string& name, ProcessPtr process);
    // Removes only if the entry is still `expected`, so a reaped process never
    // evicts a newer launch of the same server.
    bool RemoveActiveIf(const std::string& name, const tooldock::process::ServerProcess* expected);
    std::vector<std::pair<std::string, ProcessPtr>> ActiveSnapshot() const;
    std::size_t ActiveCount() const;

    void SetStatus(const std::string& name,
                   tooldock::process::ServerStatus status,
                   int port = 0,
                   std::optional<int> exit_code = std::nullopt);
    StatusRecord Record(const std::string& name) const;

    void SetStatusListener(StatusListener listener);

private:
    mutable std::mutex mutex_;
    std::vector<DefinitionPtr> ordered_;
    std::unordered_map<std::string, DefinitionPtr> definitions_;
    std::unordered_map<std::string, ProcessPtr> active_;
    std::unordered_map<std::string, StatusRecord> records_;
    StatusListener listener_;
};

}  // namespace tooldock::servers
