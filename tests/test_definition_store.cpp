#include <gtest/gtest.h>

#include "servers/definition_store.hpp"
#include "test_support.hpp"

using namespace tooldock::servers;
using tooldock::testing::ScopedEnv;
using tooldock::testing::TempDir;

TEST(ParseSource, DirectMapUnderMcpServers) {
    const auto data = nlohmann::ordered_json::parse(R"({
        "mcpServers": {
            "zeta": {"command": "/bin/zeta", "args": ["--port", "1"], "env": {"A": "1"}},
            "alpha": {"command": "alpha", "enabled": false, "tools": ["t1", "t2"]}
        }
    })");
    const auto parsed = ParseSource(data);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->shape, SourceShape::kDirect);
    ASSERT_EQ(parsed->direct.size(), 2u);
    EXPECT_EQ(parsed->direct[0].name, "zeta");
    EXPECT_EQ(parsed->direct[0].args.size(), 2u);
    EXPECT_EQ(parsed->direct[0].env.at("A"), "1");
    EXPECT_EQ(parsed->direct[1].name, "alpha");
    EXPECT_FALSE(parsed->direct[1].enabled);
    EXPECT_EQ(parsed->direct[1].declared_tools.size(), 2u);
}

TEST(ParseSource, ProviderMapUnderCapabilities) {
    const auto data = nlohmann::ordered_json::parse(R"({
        "capabilities": {
            "memory": {"enabled": true},
            "github": {"enabled": false, "tools": ["create_issue"]}
        }
    })");
    const auto parsed = ParseSource(data);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->shape, SourceShape::kProvider);
    ASSERT_EQ(parsed->providers.size(), 2u);
    EXPECT_EQ(parsed->providers[1].name, "github");
    EXPECT_FALSE(parsed->providers[1].enabled);

    const auto defs = Normalize(*parsed);
    ASSERT_EQ(defs.size(), 2u);
    EXPECT_EQ(defs[0].command, "npx");
    EXPECT_EQ(defs[1].declared_tools.count("create_issue"), 1u);
}

TEST(ParseSource, BareMapsAreClassifiedByContent) {
    const auto direct = ParseSource(nlohmann::ordered_json::parse(R"({"a": {"command": "x"}})"));
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(direct->shape, SourceShape::kDirect);

    const auto provider = ParseSource(nlohmann::ordered_json::parse(R"({"memory": {"enabled": true}})"));
    ASSERT_TRUE(provider.has_value());
    EXPECT_EQ(provider->shape, SourceShape::kProvider);

    EXPECT_FALSE(ParseSource(nlohmann::ordered_json::parse(R"({"version": 2})")).has_value());
    EXPECT_FALSE(ParseSource(nlohmann::ordered_json::parse("[1, 2]")).has_value());
}

TEST(ParseSource, InvalidEntriesAreSkippedIndividually) {
    const auto parsed = ParseSource(nlohmann::ordered_json::parse(R"({
        "servers": {
            "good": {"command": "ok"},
            "no-command": {"args": ["x"]},
            "not-object": 42
        }
    })"));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->direct.size(), 1u);
    EXPECT_EQ(parsed->direct[0].name, "good");
    EXPECT_EQ(parsed->skipped.size(), 2u);
}

TEST(Normalize, ExpandsEnvReferences) {
    ScopedEnv token("TOOLDOCK_TEST_TOKEN", "secret");
    const auto parsed = ParseSource(nlohmann::ordered_json::parse(R"({
        "mcpServers": {
            "svc": {"command": "svc", "args": ["--token=${TOOLDOCK_TEST_TOKEN}"],
                    "env": {"KEY": "${TOOLDOCK_TEST_TOKEN}", "EMPTY": "${TOOLDOCK_TEST_UNSET_VAR}"}}
        }
    })"));
    ASSERT_TRUE(parsed.has_value());
    const auto defs = Normalize(*parsed);
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].args[0], "--token=secret");
    EXPECT_EQ(defs[0].env.at("KEY"), "secret");
    EXPECT_EQ(defs[0].env.at("EMPTY"), "");
}

TEST(LoadDefinitions, FirstUsableCandidateWinsWithoutMerging) {
    TempDir dir;
    const auto missing = dir.Path() / "missing.json";
    const auto malformed = dir.Write("malformed.json", "{ not json");
    const auto empty = dir.Write("empty.json", R"({"mcpServers": {"bad": {"args": []}}})");
    const auto first = dir.Write("first.json", R"({"mcpServers": {"one": {"command": "one"}, "two": {"command": "two"}}})");
    const auto second = dir.Write("second.json", R"({"mcpServers": {"three": {"command": "three"}}})");

    const auto result = LoadDefinitions({missing, malformed, empty, first, second});
    EXPECT_FALSE(result.used_defaults);
    EXPECT_EQ(result.source, first);
    ASSERT_EQ(result.definitions.size(), 2u);
    EXPECT_EQ(result.definitions[0].name, "one");
    EXPECT_EQ(result.definitions[1].name, "two");
    EXPECT_EQ(result.skipped.size(), 3u);
}

TEST(LoadDefinitions, FallsBackToBuiltinDefaults) {
    TempDir dir;
    const auto malformed = dir.Write("bad.json", "][");
    const auto result = LoadDefinitions({dir.Path() / "nope.json", malformed});
    EXPECT_TRUE(result.used_defaults);
    EXPECT_TRUE(result.source.empty());
    ASSERT_EQ(result.definitions.size(), 4u);
    EXPECT_EQ(result.definitions[0].name, "brave-search");
}

TEST(LoadDefinitions, DefaultsHaveEnvReferencesResolved) {
    ScopedEnv home("HOME", "/tmp/tooldock-home");
    const auto result = LoadDefinitions({});
    ASSERT_TRUE(result.used_defaults);
    bool saw_filesystem = false;
    for (const auto& def : result.definitions) {
        if (def.name == "filesystem") {
            saw_filesystem = true;
            EXPECT_EQ(def.args.back(), "/tmp/tooldock-home");
        }
    }
    EXPECT_TRUE(saw_filesystem);
}

TEST(LoadDefinitionsFile, ReportsReason) {
    TempDir dir;
    std::string reason;
    EXPECT_FALSE(LoadDefinitionsFile(dir.Path() / "absent.json", &reason).has_value());
    EXPECT_EQ(reason, "not found");

    const auto shapeless = dir.Write("shapeless.json", R"({"name": "x"})");
    EXPECT_FALSE(LoadDefinitionsFile(shapeless, &reason).has_value());
    EXPECT_EQ(reason, "no server or provider map");
}
