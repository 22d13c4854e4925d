#pragma once

#include <functional>
#include <string>
#include <vector>

#include "servers/server_definition.hpp"

namespace tooldock::servers {

using EnvLookup = std::function<std::string(const std::string&)>;

// Replaces ${VAR} references; unset variables expand to "".
std::string ExpandEnvRefs(const std::string& value, const EnvLookup& lookup);
std::string ExpandEnvRefs(const std::string& value);

// Builds a definition for a capability provider from the built-in template table.
// Unknown names fall back to "npx -y @modelcontextprotocol/server-<name>".
// A non-empty tools list replaces the template's default tool set.
ServerDefinition ExpandProvider(const std::string& name,
                                bool enabled,
                                const std::vector<std::string>& tools);

bool HasBuiltinTemplate(const std::string& name);

// brave-search, filesystem, github and memory, expanded through their templates.
std::vector<ServerDefinition> BuiltinDefinitions();

}  // namespace tooldock::servers
