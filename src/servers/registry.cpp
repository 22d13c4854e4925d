#include "servers/registry.hpp"

namespace tooldock::servers {

using tooldock::process::ServerStatus;

void Registry::ReplaceDefinitions(std::vector<ServerDefinition> definitions) {
    std::lock_guard<std::mutex> lock(mutex_);
    ordered_.clear();
    definitions_.clear();
    for (auto& def : definitions) {
        if (definitions_.count(def.name) > 0) {
            continue;
        }
        auto ptr = std::make_shared<const ServerDefinition>(std::move(def));
        definitions_.emplace(ptr->name, ptr);
        ordered_.push_back(std::move(ptr));
    }
}

std::vector<Registry::DefinitionPtr> Registry::Definitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_;
}

std::vector<std::string> Registry::Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(ordered_.size());
    for (const auto& def : ordered_) {
        names.push_back(def->name);
    }
    return names;
}

Registry::DefinitionPtr Registry::FindDefinition(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        return nullptr;
    }
    return it->second;
}

Registry::ProcessPtr Registry::FindActive(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = active_.find(name);
    if (it == active_.end()) {
        return nullptr;
    }
    return it->second;
}

bool Registry::InsertActive(const std::string& name, ProcessPtr process) {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.emplace(name, std::move(process)).second;
}

bool Registry::RemoveActiveIf(const std::string& name, const tooldock::process::ServerProcess* expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = active_.find(name);
    if (it == active_.end() || it->second.get() != expected) {
        return false;
    }
    active_.erase(it);
    return true;
}

std::vector<std::pair<std::string, Registry::ProcessPtr>> Registry::ActiveSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {active_.begin(), active_.end()};
}

std::size_t Registry::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void Registry::SetStatus(const std::string& name,
                         ServerStatus status,
                         int port,
                         std::optional<int> exit_code) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = records_[name];
        record.status = status;
        if (port > 0) {
            record.port = port;
        }
        if (exit_code.has_value()) {
            record.last_exit_code = exit_code;
        }
        listener = listener_;
    }
    if (listener) {
        listener(name, status);
    }
}

StatusRecord Registry::Record(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(name);
    if (it == records_.end()) {
        return {};
    }
    return it->second;
}

void Registry::SetStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

}  // namespace tooldock::servers
