#include <gtest/gtest.h>
#include <element_discovery/discovery_gate.hpp>
#include <screen_loaders/sample_screen.hpp>
#include <future>
#include <stdexcept>
#include <thread>

using namespace element_discovery;

TEST(DiscoveryGate, RunsWhenIdle) {
    DiscoveryGate gate;
    int runs = 0;
    EXPECT_EQ(gate.try_run([&] { ++runs; }), GateOutcome::Ran);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(gate.state(), GateState::Idle);
}

TEST(DiscoveryGate, NestedRequestIsDropped) {
    DiscoveryGate gate;
    GateOutcome inner = GateOutcome::Ran;
    GateState during = GateState::Idle;
    gate.try_run([&] {
        during = gate.state();
        inner = gate.try_run([] {});
    });
    EXPECT_EQ(during, GateState::Running);
    EXPECT_EQ(inner, GateOutcome::Dropped);
    EXPECT_EQ(gate.state(), GateState::Idle);
}

TEST(DiscoveryGate, ConcurrentRequestIsDropped) {
    DiscoveryGate gate;
    std::promise<void> started;
    std::promise<void> release;
    auto release_future = release.get_future();

    std::thread worker([&] {
        gate.try_run([&] {
            started.set_value();
            release_future.wait();
        });
    });
    started.get_future().wait();
    int runs = 0;
    EXPECT_EQ(gate.try_run([&] { ++runs; }), GateOutcome::Dropped);
    release.set_value();
    worker.join();

    EXPECT_EQ(runs, 0);
    EXPECT_EQ(gate.try_run([&] { ++runs; }), GateOutcome::Ran);
    EXPECT_EQ(runs, 1);
}

TEST(DiscoveryGate, ReturnsToIdleWhenTheRunThrows) {
    DiscoveryGate gate;
    EXPECT_THROW(gate.try_run([] { throw std::runtime_error("boom"); }), std::runtime_error);
    EXPECT_EQ(gate.state(), GateState::Idle);
}

TEST(DiscoverySession, KeepsTheLatestResult) {
    const auto h = screen_hierarchy::analyze_hierarchy(screen_loaders::generate_sample_screen());
    DiscoverySession session(h);
    EXPECT_FALSE(session.latest().has_value());

    EXPECT_EQ(session.request("tab_phone_icon"), GateOutcome::Ran);
    ASSERT_TRUE(session.latest().has_value());
    EXPECT_EQ(session.latest()->effective_target, "tab_phone");

    EXPECT_EQ(session.request("missing"), GateOutcome::Ran);
    EXPECT_FALSE(session.latest()->ok());
    EXPECT_EQ(session.state(), GateState::Idle);
}
