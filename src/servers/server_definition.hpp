#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace tooldock::servers {

struct ServerDefinition {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    // An empty value means the variable is not overridden.
    std::map<std::string, std::string> env;
    bool enabled = true;
    std::set<std::string> declared_tools;
};

enum class SourceShape {
    kDirect,
    kProvider
};

struct ProviderEntry {
    std::string name;
    bool enabled = true;
    std::vector<std::string> tools;
};

struct ParsedSource {
    SourceShape shape = SourceShape::kDirect;
    std::vector<ServerDefinition> direct;
    std::vector<ProviderEntry> providers;
    std::vector<std::string> skipped;
};

}  // namespace tooldock::servers
