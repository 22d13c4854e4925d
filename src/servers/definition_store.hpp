#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "servers/server_definition.hpp"

namespace tooldock::servers {

struct LoadResult {
    std::vector<ServerDefinition> definitions;
    std::filesystem::path source;
    bool used_defaults = false;
    // One "<path>: <reason>" line per candidate that was not used.
    std::vector<std::string> skipped;
};

// Classifies a parsed document as a direct server map or a provider map and
// extracts its entries. Returns nullopt when the document has neither shape.
std::optional<ParsedSource> ParseSource(const nlohmann::ordered_json& data);

// Turns a parsed source into canonical definitions: providers go through
// ExpandProvider, and ${VAR} references in args and env are resolved.
std::vector<ServerDefinition> Normalize(const ParsedSource& source);

std::optional<std::vector<ServerDefinition>> LoadDefinitionsFile(const std::filesystem::path& path,
                                                                 std::string* reason);

// Tries each candidate in order; the first one yielding at least one definition wins.
// Falls back to BuiltinDefinitions() when none does. Never throws.
LoadResult LoadDefinitions(const std::vector<std::filesystem::path>& candidates);

}  // namespace tooldock::servers
