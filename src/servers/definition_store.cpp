#include "servers/definition_store.hpp"

#include <fstream>
#include <sstream>

#include "servers/provider_templates.hpp"
#include "utils/logging.hpp"

namespace tooldock::servers {
namespace {

using Json = nlohmann::ordered_json;

const Json* FindObject(const Json& data, const char* key) {
    if (data.contains(key) && data[key].is_object()) {
        return &data[key];
    }
    return nullptr;
}

std::vector<std::string> ReadStringArray(const Json& value) {
    std::vector<std::string> items;
    if (!value.is_array()) {
        return items;
    }
    for (const auto& item : value) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        } else if (item.is_number()) {
            items.push_back(item.dump());
        }
    }
    return items;
}

void ParseDirectMap(const Json& servers, ParsedSource& out) {
    for (const auto& [name, entry] : servers.items()) {
        if (name.empty()) {
            out.skipped.push_back("(unnamed): empty server name");
            continue;
        }
        if (!entry.is_object()) {
            out.skipped.push_back(name + ": entry is not an object");
            continue;
        }
        if (!entry.contains("command") || !entry["command"].is_string() ||
            entry["command"].get<std::string>().empty()) {
            out.skipped.push_back(name + ": missing command");
            continue;
        }
        ServerDefinition def{};
        def.name = name;
        def.command = entry["command"].get<std::string>();
        if (entry.contains("args")) {
            def.args = ReadStringArray(entry["args"]);
        }
        if (entry.contains("env") && entry["env"].is_object()) {
            for (const auto& [key, value] : entry["env"].items()) {
                if (value.is_string()) {
                    def.env[key] = value.get<std::string>();
                } else if (value.is_number() || value.is_boolean()) {
                    def.env[key] = value.dump();
                } else if (value.is_null()) {
                    def.env[key] = std::string();
                }
            }
        }
        if (entry.contains("enabled") && entry["enabled"].is_boolean()) {
            def.enabled = entry["enabled"].get<bool>();
        }
        if (entry.contains("tools")) {
            const auto tools = ReadStringArray(entry["tools"]);
            def.declared_tools.insert(tools.begin(), tools.end());
        }
        out.direct.push_back(std::move(def));
    }
}

void ParseProviderMap(const Json& providers, ParsedSource& out) {
    for (const auto& [name, entry] : providers.items()) {
        if (name.empty()) {
            out.skipped.push_back("(unnamed): empty provider name");
            continue;
        }
        ProviderEntry provider{};
        provider.name = name;
        if (entry.is_boolean()) {
            provider.enabled = entry.get<bool>();
        } else if (entry.is_object()) {
            if (entry.contains("enabled") && entry["enabled"].is_boolean()) {
                provider.enabled = entry["enabled"].get<bool>();
            }
            if (entry.contains("tools")) {
                provider.tools = ReadStringArray(entry["tools"]);
            }
        } else {
            out.skipped.push_back(name + ": provider entry is not an object");
            continue;
        }
        out.providers.push_back(std::move(provider));
    }
}

void ResolveEnvRefs(ServerDefinition& def) {
    def.command = ExpandEnvRefs(def.command);
    for (auto& arg : def.args) {
        arg = ExpandEnvRefs(arg);
    }
    for (auto& [_, value] : def.env) {
        value = ExpandEnvRefs(value);
    }
}

bool LooksLikeDirectMap(const Json& data) {
    for (const auto& [_, entry] : data.items()) {
        if (entry.is_object() && entry.contains("command")) {
            return true;
        }
    }
    return false;
}

bool LooksLikeProviderMap(const Json& data) {
    for (const auto& [_, entry] : data.items()) {
        if (entry.is_object() && (entry.contains("enabled") || entry.contains("tools"))) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::optional<ParsedSource> ParseSource(const nlohmann::ordered_json& data) {
    if (!data.is_object() || data.empty()) {
        return std::nullopt;
    }

    ParsedSource out{};
    if (const auto* servers = FindObject(data, "mcpServers")) {
        out.shape = SourceShape::kDirect;
        ParseDirectMap(*servers, out);
        return out;
    }
    if (const auto* servers = FindObject(data, "servers")) {
        out.shape = SourceShape::kDirect;
        ParseDirectMap(*servers, out);
        return out;
    }
    const auto* providers = FindObject(data, "providers");
    if (!providers) {
        providers = FindObject(data, "capabilities");
    }
    if (providers) {
        out.shape = SourceShape::kProvider;
        ParseProviderMap(*providers, out);
        return out;
    }
    if (LooksLikeDirectMap(data)) {
        out.shape = SourceShape::kDirect;
        ParseDirectMap(data, out);
        return out;
    }
    if (LooksLikeProviderMap(data)) {
        out.shape = SourceShape::kProvider;
        ParseProviderMap(data, out);
        return out;
    }
    return std::nullopt;
}

std::vector<ServerDefinition> Normalize(const ParsedSource& source) {
    std::vector<ServerDefinition> defs;
    if (source.shape == SourceShape::kProvider) {
        for (const auto& provider : source.providers) {
            defs.push_back(ExpandProvider(provider.name, provider.enabled, provider.tools));
        }
    } else {
        defs = source.direct;
    }

    for (auto& def : defs) {
        ResolveEnvRefs(def);
    }
    return defs;
}

std::optional<std::vector<ServerDefinition>> LoadDefinitionsFile(const std::filesystem::path& path,
                                                                 std::string* reason) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (reason) {
            *reason = "not found";
        }
        return std::nullopt;
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        if (reason) {
            *reason = "unreadable";
        }
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    const auto data = nlohmann::ordered_json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded()) {
        if (reason) {
            *reason = "malformed JSON";
        }
        return std::nullopt;
    }

    const auto parsed = ParseSource(data);
    if (!parsed.has_value()) {
        if (reason) {
            *reason = "no server or provider map";
        }
        return std::nullopt;
    }
    for (const auto& skipped : parsed->skipped) {
        tooldock::utils::LogWarn("definitions", path.string() + ": skipping " + skipped);
    }

    auto defs = Normalize(*parsed);
    if (defs.empty()) {
        if (reason) {
            *reason = "no valid definitions";
        }
        return std::nullopt;
    }
    return defs;
}

LoadResult LoadDefinitions(const std::vector<std::filesystem::path>& candidates) {
    LoadResult result{};
    for (const auto& candidate : candidates) {
        std::string reason;
        auto defs = LoadDefinitionsFile(candidate, &reason);
        if (!defs.has_value()) {
            result.skipped.push_back(candidate.string() + ": " + reason);
            if (reason == "not found") {
                tooldock::utils::LogDebug("definitions", "no source at " + candidate.string());
            } else {
                tooldock::utils::LogWarn("definitions", "skipping " + candidate.string() + ": " + reason);
            }
            continue;
        }
        tooldock::utils::LogInfo("definitions", "loaded " + std::to_string(defs->size()) +
                                 " servers from " + candidate.string());
        result.definitions = std::move(*defs);
        result.source = candidate;
        return result;
    }

    tooldock::utils::LogWarn("definitions", "no usable server configuration; using built-in defaults");
    result.definitions = BuiltinDefinitions();
    for (auto& def : result.definitions) {
        ResolveEnvRefs(def);
    }
    result.used_defaults = true;
    return result;
}

}  // namespace tooldock::servers
