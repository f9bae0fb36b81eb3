#include <gtest/gtest.h>

#include <future>
#include <thread>

#include "runtime/ShutdownBroadcaster.hpp"
#include "supervisor/ProcessSupervisor.hpp"
#include "Fakes.hpp"

using namespace onionsite;
using namespace onionsite::test;

namespace {

SupervisorPolicy fast_policy() {
    SupervisorPolicy p;
    p.max_attempts  = 5;
    p.backoff       = milliseconds(20);
    p.poll_interval = milliseconds(2);
    return p;
}

Command helper() {
    return Command{"./arti", {"proxy", "-c", "/etc/arti/onionservice.toml"}};
}

template <typename Pred>
bool eventually(Pred pred, milliseconds limit = milliseconds(3000)) {
    auto until = Clock::now() + limit;
    while (Clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(1));
    }
    return pred();
}

} // namespace

TEST(ProcessSupervisor, ExhaustsBudgetOnRepeatedExits) {
    FakeLauncher launcher({}, Behaviour::exit_after(milliseconds(1), 1));
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());

    EXPECT_EQ(sup.run(), SupervisorState::Failed);
    EXPECT_EQ(sup.state(), SupervisorState::Failed);
    EXPECT_EQ(launcher.stats.launches.load(), 5);
    EXPECT_EQ(sup.attempts(), 5);
    EXPECT_TRUE(shutdown.fired());
    EXPECT_EQ(launcher.stats.alive.load(), 0);
    EXPECT_EQ(launcher.last_command.to_string(), helper().to_string());
}

TEST(ProcessSupervisor, RestartsAfterBackoff) {
    FakeLauncher launcher({}, Behaviour::exit_after(milliseconds(0), 1));
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());
    sup.run();

    auto times = launcher.launch_times();
    ASSERT_EQ(times.size(), 5u);
    for (std::size_t i = 1; i < times.size(); ++i) {
        EXPECT_GE(times[i] - times[i - 1], milliseconds(20)) << "launch " << i;
    }
}

TEST(ProcessSupervisor, SuccessfulExitIsStillRestarted) {
    FakeLauncher launcher({Behaviour::exit_after(milliseconds(1), 0)}, Behaviour::forever());
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());

    auto result = std::async(std::launch::async, [&] { return sup.run(); });
    ASSERT_TRUE(eventually([&] { return launcher.stats.launches.load() == 2; }));
    ASSERT_TRUE(eventually([&] { return sup.state() == SupervisorState::Running; }));

    shutdown.fire();
    EXPECT_EQ(result.get(), SupervisorState::Stopped);
    EXPECT_EQ(sup.attempts(), 1);
}

TEST(ProcessSupervisor, LaunchFailuresCountAgainstBudget) {
    FakeLauncher launcher({}, Behaviour::fail());
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());

    auto t0 = Clock::now();
    EXPECT_EQ(sup.run(), SupervisorState::Failed);
    EXPECT_EQ(launcher.stats.failures.load(), 5);
    EXPECT_EQ(launcher.stats.launches.load(), 5);
    EXPECT_GE(Clock::now() - t0, milliseconds(5 * 20));
    EXPECT_TRUE(shutdown.fired());
}

TEST(ProcessSupervisor, ShutdownWhileRunningKillsAndStops) {
    FakeLauncher launcher({}, Behaviour::forever());
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());

    auto result = std::async(std::launch::async, [&] { return sup.run(); });
    ASSERT_TRUE(eventually([&] { return sup.state() == SupervisorState::Running; }));

    shutdown.fire();
    EXPECT_EQ(result.get(), SupervisorState::Stopped);
    EXPECT_EQ(launcher.stats.launches.load(), 1);
    EXPECT_EQ(launcher.stats.kills.load(), 1);
    EXPECT_EQ(launcher.stats.reaped.load(), 1);
    EXPECT_EQ(launcher.stats.alive.load(), 0);
    EXPECT_EQ(sup.attempts(), 0);
}

TEST(ProcessSupervisor, ShutdownDuringBackoffStops) {
    SupervisorPolicy policy = fast_policy();
    policy.backoff = milliseconds(5000);
    FakeLauncher launcher({}, Behaviour::exit_after(milliseconds(0), 3));
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, policy);

    auto result = std::async(std::launch::async, [&] { return sup.run(); });
    ASSERT_TRUE(eventually([&] { return launcher.stats.reaped.load() == 1; }));

    auto t0 = Clock::now();
    shutdown.fire();
    EXPECT_EQ(result.get(), SupervisorState::Stopped);
    EXPECT_LT(Clock::now() - t0, milliseconds(2000));
    EXPECT_EQ(launcher.stats.launches.load(), 1);
    EXPECT_EQ(launcher.stats.kills.load(), 0);
}

TEST(ProcessSupervisor, ShutdownBeforeStartNeverLaunches) {
    FakeLauncher launcher;
    ShutdownBroadcaster shutdown;
    shutdown.fire();
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());

    EXPECT_EQ(sup.run(), SupervisorState::Stopped);
    EXPECT_EQ(launcher.stats.launches.load(), 0);
}

TEST(ProcessSupervisor, MixedFailuresThenStableThenShutdown) {
    FakeLauncher launcher({Behaviour::fail(),
                           Behaviour::exit_after(milliseconds(1), 0),
                           Behaviour::exit_after(milliseconds(1), 1)},
                          Behaviour::forever());
    ShutdownBroadcaster shutdown;
    ProcessSupervisor sup(launcher, helper(), shutdown, fast_policy());

    auto result = std::async(std::launch::async, [&] { return sup.run(); });
    ASSERT_TRUE(eventually([&] {
        return launcher.stats.launches.load() == 4 && sup.state() == SupervisorState::Running;
    }));
    EXPECT_EQ(sup.attempts(), 3);
    EXPECT_FALSE(shutdown.fired());

    shutdown.fire();
    EXPECT_EQ(result.get(), SupervisorState::Stopped);
    EXPECT_EQ(launcher.stats.kills.load(), 1);
    EXPECT_EQ(launcher.stats.alive.load(), 0);
}

TEST(ProcessSupervisor, StateNames) {
    EXPECT_STREQ(to_string(SupervisorState::Idle), "IDLE");
    EXPECT_STREQ(to_string(SupervisorState::Running), "RUNNING");
    EXPECT_STREQ(to_string(SupervisorState::Failed), "FAILED");
}
