#include <gtest/gtest.h>

#include <signal.h>

#include <atomic>

#include "monitor/health_monitor.hpp"
#include "process/process_launcher.hpp"
#include "test_support.hpp"

using namespace tooldock::testing;
using tooldock::monitor::HealthMonitor;
using tooldock::monitor::ReapedServer;
using tooldock::process::ProcessLauncher;
using tooldock::process::ServerStatus;
using tooldock::servers::PortAllocator;
using tooldock::servers::Registry;

namespace {

struct Harness {
    explicit Harness(int base_port, std::vector<tooldock::servers::ServerDefinition> defs)
        : config(TestConfig(base_port, logs.Path()))
        , ports(config.host, config.base_port, config.port_search_window,
                std::chrono::milliseconds(config.timeouts.probe_timeout_ms)) {
        registry.ReplaceDefinitions(std::move(defs));
        ports.Assign(registry.Names());
        launcher = std::make_unique<ProcessLauncher>(config, registry, ports);
    }
    ~Harness() {
        launcher->StopAll();
    }

    TempDir logs;
    tooldock::config::SupervisorConfig config;
    Registry registry;
    PortAllocator ports;
    std::unique_ptr<ProcessLauncher> launcher;
};

}  // namespace

TEST(HealthMonitor, CheckNowReapsKilledProcess) {
    Harness h(43000, {EchoDefinition("a"), EchoDefinition("b")});
    const auto a = h.launcher->Start("a");
    const auto b = h.launcher->Start("b");
    ASSERT_TRUE(a.ok);
    ASSERT_TRUE(b.ok);

    HealthMonitor monitor(h.registry, h.ports, std::chrono::milliseconds(60000));
    EXPECT_TRUE(monitor.CheckNow().empty());

    ASSERT_EQ(::kill(a.process->Child().Pid(), SIGKILL), 0);
    std::vector<ReapedServer> reaped;
    ASSERT_TRUE(WaitFor([&]() {
        auto pass = monitor.CheckNow();
        reaped.insert(reaped.end(), pass.begin(), pass.end());
        return !reaped.empty();
    }, std::chrono::milliseconds(2000)));

    ASSERT_EQ(reaped.size(), 1u);
    EXPECT_EQ(reaped[0].name, "a");
    ASSERT_TRUE(reaped[0].exit_code.has_value());
    EXPECT_EQ(*reaped[0].exit_code, 128 + SIGKILL);
    EXPECT_EQ(h.registry.FindActive("a"), nullptr);
    EXPECT_NE(h.registry.FindActive("b"), nullptr);
    EXPECT_EQ(h.registry.Record("a").status, ServerStatus::kCrashed);
    EXPECT_FALSE(a.process->LogsOpen());
}

TEST(HealthMonitor, BackgroundLoopReapsWithinInterval) {
    Harness h(43010, {EchoDefinition("a")});
    const auto a = h.launcher->Start("a");
    ASSERT_TRUE(a.ok);

    std::atomic<int> exits{0};
    HealthMonitor monitor(h.registry, h.ports, std::chrono::milliseconds(200),
                          [&exits](const ReapedServer&) { ++exits; });
    monitor.Start();
    EXPECT_TRUE(monitor.IsRunning());

    ::kill(a.process->Child().Pid(), SIGKILL);
    EXPECT_TRUE(WaitFor([&]() { return h.registry.FindActive("a") == nullptr; },
                        std::chrono::milliseconds(1500)));
    EXPECT_EQ(exits.load(), 1);

    monitor.Stop();
    EXPECT_FALSE(monitor.IsRunning());
}

TEST(HealthMonitor, ReapedServerRestartsOnNextStart) {
    Harness h(43020, {EchoDefinition("a")});
    const auto first = h.launcher->Start("a");
    ASSERT_TRUE(first.ok);
    HealthMonitor monitor(h.registry, h.ports, std::chrono::milliseconds(60000));

    ::kill(first.process->Child().Pid(), SIGKILL);
    ASSERT_TRUE(WaitFor([&]() { return !monitor.CheckNow().empty(); }, std::chrono::milliseconds(2000)));

    const auto second = h.launcher->Start("a");
    ASSERT_TRUE(second.ok) << second.error.Describe();
    EXPECT_FALSE(second.already_running);
    EXPECT_EQ(second.process->Port(), 43020);
}

TEST(HealthMonitor, StopDuringReconciliationIsNotReportedAsCrash) {
    Harness h(43030, {EchoDefinition("a")});
    ASSERT_TRUE(h.launcher->Start("a").ok);

    std::atomic<int> exits{0};
    HealthMonitor monitor(h.registry, h.ports, std::chrono::milliseconds(20),
                          [&exits](const ReapedServer&) { ++exits; });
    monitor.Start();
    const auto stopped = h.launcher->Stop("a");
    monitor.Stop();

    EXPECT_TRUE(stopped.ok);
    EXPECT_EQ(exits.load(), 0);
    EXPECT_EQ(h.registry.Record("a").status, ServerStatus::kStopped);
}

TEST(HealthMonitor, ZeroIntervalIsRaisedToFloor) {
    Harness h(43040, {EchoDefinition("a")});
    HealthMonitor monitor(h.registry, h.ports, std::chrono::milliseconds(0));
    EXPECT_GE(monitor.Interval(), std::chrono::milliseconds(100));
    monitor.Start();
    monitor.Stop();
    EXPECT_FALSE(monitor.IsRunning());
}
