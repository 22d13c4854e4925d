#include "servers/provider_templates.hpp"

#include <array>

#include "utils/common.hpp"

namespace tooldock::servers {
namespace {

struct ProviderTemplate {
    const char* name;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<std::string> tools;
};

const std::vector<ProviderTemplate>& Templates() {
    static const std::vector<ProviderTemplate> kTemplates = {
        {"github",
         {"-y", "@modelcontextprotocol/server-github"},
         {{"GITHUB_PERSONAL_ACCESS_TOKEN", "${GITHUB_TOKEN}"}},
         {"list_repositories", "create_repository", "fork_repository", "create_issue", "create_pull_request"}},
        {"brave-search",
         {"-y", "@modelcontextprotocol/server-brave-search"},
         {{"BRAVE_API_KEY", "${BRAVE_API_KEY}"}},
         {"brave_web_search", "brave_local_search"}},
        {"filesystem",
         {"-y", "@modelcontextprotocol/server-filesystem", "${HOME}"},
         {},
         {"read_file", "write_file", "list_directory", "create_directory", "delete_file", "move_file"}},
        {"memory",
         {"-y", "@modelcontextprotocol/server-memory"},
         {},
         {"read_graph", "create_entities", "create_relations", "search_nodes"}},
        {"puppeteer", {"-y", "@modelcontextprotocol/server-puppeteer"}, {}, {}},
        {"sequential-thinking", {"-y", "@modelcontextprotocol/server-sequential-thinking"}, {}, {}},
        {"playwright", {"-y", "@executeautomation/playwright-mcp-server"}, {}, {}},
        {"postgresql", {"-y", "@modelcontextprotocol/server-postgres", "${DATABASE_URL}"}, {}, {}},
    };
    return kTemplates;
}

const ProviderTemplate* FindTemplate(const std::string& name) {
    for (const auto& entry : Templates()) {
        if (name == entry.name) {
            return &entry;
        }
    }
    return nullptr;
}

bool IsVarChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

}  // namespace

std::string ExpandEnvRefs(const std::string& value, const EnvLookup& lookup) {
    std::string out;
    out.reserve(value.size());
    std::size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            const auto close = value.find('}', i + 2);
            if (close != std::string::npos) {
                const auto var = value.substr(i + 2, close - i - 2);
                bool valid = !var.empty();
                for (char c : var) {
                    valid = valid && IsVarChar(c);
                }
                if (valid) {
                    out += lookup(var);
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(value[i]);
        ++i;
    }
    return out;
}

std::string ExpandEnvRefs(const std::string& value) {
    return ExpandEnvRefs(value, [](const std::string& var) {
        return tooldock::utils::GetEnv(var.c_str());
    });
}

ServerDefinition ExpandProvider(const std::string& name,
                                bool enabled,
                                const std::vector<std::string>& tools) {
    ServerDefinition def{};
    def.name = name;
    def.command = "npx";
    def.enabled = enabled;

    const auto* tmpl = FindTemplate(name);
    if (tmpl) {
        def.args = tmpl->args;
        def.env = tmpl->env;
        def.declared_tools.insert(tmpl->tools.begin(), tmpl->tools.end());
    } else {
        def.args = {"-y", "@modelcontextprotocol/server-" + name};
    }

    if (!tools.empty()) {
        def.declared_tools.clear();
        def.declared_tools.insert(tools.begin(), tools.end());
    }
    return def;
}

bool HasBuiltinTemplate(const std::string& name) {
    return FindTemplate(name) != nullptr;
}

std::vector<ServerDefinition> BuiltinDefinitions() {
    static const std::array<const char*, 4> kDefaults = {"brave-search", "filesystem", "github", "memory"};
    std::vector<ServerDefinition> defs;
    defs.reserve(kDefaults.size());
    for (const auto* name : kDefaults) {
        defs.push_back(ExpandProvider(name, true, {}));
    }
    return defs;
}

}  // namespace tooldock::servers
