#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <signal.h>
#include <thread>
#include <vector>

#include "supervisor/supervisor.hpp"
#include "test_support.hpp"

using namespace tooldock::testing;
using tooldock::process::ServerStatus;
using tooldock::supervisor::Supervisor;

TEST(Supervisor, EndToEndScenario) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45000, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A"), EchoDefinition("B")});

    const auto servers = supervisor.ListServers();
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0].name, "A");
    EXPECT_EQ(servers[1].name, "B");
    EXPECT_TRUE(servers[0].enabled);
    EXPECT_TRUE(servers[1].enabled);

    const auto started = supervisor.StartAll();
    EXPECT_EQ(started, (std::map<std::string, bool>{{"A", true}, {"B", true}}));

    const auto a = supervisor.GetStatus("A");
    const auto b = supervisor.GetStatus("B");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(a->running);
    EXPECT_EQ(a->port, 45000);
    EXPECT_EQ(b->port, 45001);
    EXPECT_EQ(a->health, "healthy");
    EXPECT_GT(a->pid, 0);

    const auto reply = supervisor.CallTool("A", "ping", nlohmann::json::object());
    ASSERT_TRUE(reply.ok) << reply.error.Describe();
    EXPECT_EQ(reply.payload["server"], "A");
    EXPECT_EQ(reply.payload["method"], "ping");

    const auto stopped = supervisor.StopAll();
    EXPECT_EQ(stopped, (std::map<std::string, bool>{{"A", true}, {"B", true}}));

    const auto all = supervisor.GetAllStatus();
    ASSERT_EQ(all.size(), 2u);
    for (const auto& [name, report] : all) {
        EXPECT_FALSE(report.running) << name;
        EXPECT_EQ(report.status, ServerStatus::kStopped) << name;
        EXPECT_TRUE(report.last_exit_code.has_value()) << name;
    }
}

TEST(Supervisor, UnknownServerHasNoStatus) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45010, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A")});
    EXPECT_FALSE(supervisor.GetStatus("Z").has_value());

    const auto never_started = supervisor.GetStatus("A");
    ASSERT_TRUE(never_started.has_value());
    EXPECT_FALSE(never_started->running);
    EXPECT_EQ(never_started->status, ServerStatus::kStopped);
    EXPECT_EQ(never_started->port, 45010);
    EXPECT_FALSE(never_started->last_exit_code.has_value());
}

TEST(Supervisor, OnDemandCallObservesStartTransitionsFirst) {
    TempDir logs;
    std::mutex mutex;
    std::vector<ServerStatus> transitions;
    Supervisor supervisor(TestConfig(45020, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A")});

    supervisor.SetStatusListener([&](const std::string& name, ServerStatus status) {
        if (name == "A") {
            std::lock_guard<std::mutex> lock(mutex);
            transitions.push_back(status);
        }
    });

    ASSERT_EQ(supervisor.GetStatus("A")->status, ServerStatus::kStopped);
    const auto reply = supervisor.CallTool("A", "ping", nlohmann::json::object());
    ASSERT_TRUE(reply.ok) << reply.error.Describe();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_GE(transitions.size(), 2u);
    EXPECT_EQ(transitions[0], ServerStatus::kStarting);
    EXPECT_EQ(transitions[1], ServerStatus::kRunning);
}

TEST(Supervisor, ConcurrentStartServerConverges) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45030, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A")});

    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&]() {
            if (supervisor.StartServer("A")) {
                ++successes;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(successes.load(), 5);
    const auto status = supervisor.GetStatus("A");
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->running);
}

TEST(Supervisor, AdjacentServersNeverShareAPortUnderConcurrency) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45040, logs.Path()));
    std::vector<tooldock::servers::ServerDefinition> defs;
    for (int i = 0; i < 4; ++i) {
        defs.push_back(EchoDefinition("S" + std::to_string(i)));
    }
    supervisor.SetDefinitions(defs);
    // Force overrides into the same region the neighbours were assigned.
    PortBlocker blocker(45040);
    ASSERT_TRUE(blocker.Ok());

    std::vector<std::thread> threads;
    for (const auto& def : defs) {
        threads.emplace_back([&supervisor, name = def.name]() { supervisor.StartServer(name); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int> ports;
    for (const auto& [name, report] : supervisor.GetAllStatus()) {
        ASSERT_TRUE(report.running) << name;
        EXPECT_NE(report.port, 45040) << name;
        ports.insert(report.port);
    }
    EXPECT_EQ(ports.size(), defs.size());
}

TEST(Supervisor, MonitorReconcilesExternallyKilledServer) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45050, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A")});
    ASSERT_TRUE(supervisor.StartServer("A"));
    supervisor.StartMonitor();

    const auto pid = supervisor.GetStatus("A")->pid;
    ASSERT_EQ(::kill(pid, SIGKILL), 0);
    EXPECT_TRUE(WaitFor([&]() { return supervisor.GetStatus("A")->status == ServerStatus::kCrashed; },
                        std::chrono::milliseconds(1500)));
    const auto status = supervisor.GetStatus("A");
    EXPECT_FALSE(status->running);
    EXPECT_EQ(status->health, "crashed");
    ASSERT_TRUE(status->last_exit_code.has_value());

    // Crashed behaves like stopped for the next call.
    const auto reply = supervisor.CallTool("A", "ping", nlohmann::json::object());
    EXPECT_TRUE(reply.ok) << reply.error.Describe();
}

TEST(Supervisor, RestartServerKeepsItAvailable) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45060, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A")});
    ASSERT_TRUE(supervisor.StartServer("A"));
    const auto before = supervisor.GetStatus("A")->pid;
    ASSERT_TRUE(supervisor.RestartServer("A"));
    const auto after = supervisor.GetStatus("A");
    EXPECT_TRUE(after->running);
    EXPECT_NE(after->pid, before);
    EXPECT_TRUE(supervisor.StopServer("A"));
    EXPECT_TRUE(supervisor.StopServer("A"));
}

TEST(Supervisor, ReloadStopsServersThatDisappeared) {
    TempDir logs;
    TempDir configs;
    const auto echo = EchoServerPath();
    const auto first = configs.Write("servers.json",
        nlohmann::json{{"mcpServers", {{"A", {{"command", echo}}}, {"B", {{"command", echo}}}}}}.dump());

    Supervisor supervisor(TestConfig(45070, logs.Path()));
    const auto loaded = supervisor.LoadDefinitions({first});
    ASSERT_FALSE(loaded.used_defaults);
    ASSERT_EQ(loaded.definitions.size(), 2u);
    ASSERT_TRUE(supervisor.StartServer("A"));
    ASSERT_TRUE(supervisor.StartServer("B"));
    const auto b_pid = supervisor.GetStatus("B")->pid;

    configs.Write("servers.json", nlohmann::json{{"mcpServers", {{"B", {{"command", echo}}}}}}.dump());
    const auto reloaded = supervisor.Reload();
    ASSERT_EQ(reloaded.definitions.size(), 1u);

    EXPECT_FALSE(supervisor.GetStatus("A").has_value());
    const auto b = supervisor.GetStatus("B");
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(b->running);
    EXPECT_EQ(b->pid, b_pid);
}

TEST(Supervisor, DestructorStopsLaunchedServers) {
    TempDir logs;
    int pid = 0;
    {
        Supervisor supervisor(TestConfig(45080, logs.Path()));
        supervisor.SetDefinitions({EchoDefinition("A")});
        ASSERT_TRUE(supervisor.StartServer("A"));
        pid = supervisor.GetStatus("A")->pid;
        supervisor.StartMonitor();
    }
    ASSERT_GT(pid, 0);
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST(Supervisor, StatusJsonShape) {
    tooldock::supervisor::ServerStatusReport report{};
    report.name = "A";
    report.status = ServerStatus::kCrashed;
    report.port = 4000;
    report.last_exit_code = 137;
    report.health = "crashed";
    report.tools = {"ping"};
    const auto json = tooldock::supervisor::StatusToJson(report);
    EXPECT_EQ(json["running"], false);
    EXPECT_EQ(json["status"], "crashed");
    EXPECT_EQ(json["port"], 4000);
    EXPECT_EQ(json["lastExitCode"], 137);
    EXPECT_EQ(json["tools"][0], "ping");
}

TEST(Supervisor, DestructionDoesNotNotifyStatusListener) {
    TempDir logs;
    std::mutex mutex;
    std::vector<ServerStatus> transitions;
    {
        Supervisor supervisor(TestConfig(45090, logs.Path()));
        supervisor.SetDefinitions({EchoDefinition("A")});
        supervisor.SetStatusListener([&](const std::string&, ServerStatus status) {
            std::lock_guard<std::mutex> lock(mutex);
            transitions.push_back(status);
        });
        ASSERT_TRUE(supervisor.StartServer("A"));
    }
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(transitions.empty());
    EXPECT_EQ(transitions.back(), ServerStatus::kRunning);
    for (const auto status : transitions) {
        EXPECT_NE(status, ServerStatus::kStopped);
    }
}

TEST(Supervisor, StartServersReportsEachRequestedServer) {
    TempDir logs;
    Supervisor supervisor(TestConfig(45100, logs.Path()));
    supervisor.SetDefinitions({EchoDefinition("A"), EchoDefinition("B", {{"ECHO_CRASH", "1"}})});

    const auto named = supervisor.StartServers({"A", "missing"});
    ASSERT_EQ(named.size(), 2u);
    EXPECT_TRUE(named.at("A").ok);
    EXPECT_EQ(named.at("missing").error.kind, tooldock::supervisor::ErrorKind::kUnknownServer);

    const auto all = supervisor.StartServers({});
    ASSERT_EQ(all.size(), 2u);
    EXPECT_TRUE(all.at("A").ok);
    EXPECT_TRUE(all.at("A").already_running);
    EXPECT_FALSE(all.at("B").ok);
    EXPECT_EQ(all.at("B").error.kind, tooldock::supervisor::ErrorKind::kLaunchFailure);
}
