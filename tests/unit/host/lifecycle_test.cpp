#include <gtest/gtest.h>

#include <nmbridge/host/lifecycle.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace nmbridge;
using namespace nmbridge::host;
using namespace std::chrono_literals;

TEST(ShutdownSignalTest, FirstFireWins) {
    ShutdownSignal signal;
    EXPECT_FALSE(signal.fired());
    EXPECT_FALSE(signal.waitFor(10ms));

    EXPECT_TRUE(signal.fire(ShutdownReason::ControlRequest));
    EXPECT_FALSE(signal.fire(ShutdownReason::Signal));
    EXPECT_TRUE(signal.fired());
    EXPECT_EQ(signal.reason(), ShutdownReason::ControlRequest);
    EXPECT_TRUE(signal.waitFor(0ms));
}

TEST(ShutdownSignalTest, ConcurrentTriggersFireOnce) {
    ShutdownSignal signal;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (signal.fire(ShutdownReason::TransportClosed))
                winners.fetch_add(1);
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST(LifecycleTest, NamesAndExitCodes) {
    EXPECT_STREQ(hostStateName(HostState::ShuttingDown), "shutting_down");
    EXPECT_STREQ(shutdownReasonName(ShutdownReason::TransportError), "transport_error");
    EXPECT_EQ(exitCodeFor(ShutdownReason::Signal), exit_code::CLEAN);
    EXPECT_EQ(exitCodeFor(ShutdownReason::ControlRequest), exit_code::CLEAN);
    EXPECT_EQ(exitCodeFor(ShutdownReason::TransportClosed), exit_code::CLEAN);
    EXPECT_EQ(exitCodeFor(ShutdownReason::TransportError), exit_code::TRANSPORT_ERROR);
}

TEST(LifecycleTest, RunsStepsInOrderAndReachesStopped) {
    LifecycleCoordinator lifecycle;
    std::vector<std::string> ran;
    std::vector<std::pair<HostState, HostState>> transitions;
    lifecycle.addObserver([&](HostState from, HostState to) { transitions.emplace_back(from, to); });
    lifecycle.addShutdownStep("first", [&] {
        ran.push_back("first");
        EXPECT_EQ(lifecycle.state(), HostState::ShuttingDown);
    });
    lifecycle.addShutdownStep("second", [&] { ran.push_back("second"); });

    EXPECT_EQ(lifecycle.state(), HostState::Starting);
    lifecycle.markRunning();
    EXPECT_EQ(lifecycle.state(), HostState::Running);

    EXPECT_TRUE(lifecycle.requestShutdown(ShutdownReason::ControlRequest));
    EXPECT_FALSE(lifecycle.requestShutdown(ShutdownReason::TransportError));

    EXPECT_EQ(lifecycle.run(), exit_code::CLEAN);
    EXPECT_EQ(lifecycle.state(), HostState::Stopped);
    EXPECT_EQ(lifecycle.shutdownReason(), ShutdownReason::ControlRequest);
    EXPECT_EQ(ran, (std::vector<std::string>{"first", "second"}));

    const std::vector<HostState> expected{HostState::Starting, HostState::Running,
                                          HostState::ShuttingDown, HostState::Stopped};
    EXPECT_EQ(lifecycle.history(), expected);
    ASSERT_EQ(transitions.size(), 3u);
    EXPECT_EQ(transitions.back().second, HostState::Stopped);
}

TEST(LifecycleTest, RunBlocksUntilRequested) {
    LifecycleCoordinator lifecycle;
    lifecycle.markRunning();
    auto running = std::async(std::launch::async, [&] { return lifecycle.run(); });
    EXPECT_EQ(running.wait_for(50ms), std::future_status::timeout);

    lifecycle.requestShutdown(ShutdownReason::TransportError);
    ASSERT_EQ(running.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(running.get(), exit_code::TRANSPORT_ERROR);
}

TEST(LifecycleTest, StepsRunOnceEvenWhenRunIsCalledTwice) {
    LifecycleCoordinator lifecycle;
    int count = 0;
    lifecycle.addShutdownStep("count", [&] { ++count; });
    lifecycle.requestShutdown(ShutdownReason::Signal);

    EXPECT_EQ(lifecycle.run(), exit_code::CLEAN);
    EXPECT_EQ(lifecycle.run(), exit_code::CLEAN);
    EXPECT_EQ(count, 1);
}

TEST(LifecycleTest, FailingStepDoesNotBlockLaterSteps) {
    LifecycleCoordinator lifecycle;
    bool releasedListener = false;
    lifecycle.addShutdownStep("explodes", [] { throw std::runtime_error("boom"); });
    lifecycle.addShutdownStep("release-listener", [&] { releasedListener = true; });
    lifecycle.requestShutdown(ShutdownReason::Signal);

    EXPECT_EQ(lifecycle.run(), exit_code::CLEAN);
    EXPECT_TRUE(releasedListener);
}

TEST(LifecycleTest, ShutdownDuringStartupSkipsRunning) {
    LifecycleCoordinator lifecycle;
    lifecycle.requestShutdown(ShutdownReason::TransportClosed);
    lifecycle.run();

    const std::vector<HostState> expected{HostState::Starting, HostState::ShuttingDown,
                                          HostState::Stopped};
    EXPECT_EQ(lifecycle.history(), expected);

    // Late start event is ignored once stopped
    lifecycle.markRunning();
    EXPECT_EQ(lifecycle.state(), HostState::Stopped);
}

TEST(SignalWatcherTest, SigtermRequestsShutdown) {
    LifecycleCoordinator lifecycle;
    SignalWatcher watcher(lifecycle);
    ASSERT_TRUE(watcher.start());

    std::raise(SIGTERM);
    EXPECT_TRUE(lifecycle.signal().waitFor(2s));
    EXPECT_EQ(lifecycle.shutdownReason(), ShutdownReason::Signal);
    watcher.stop();
}
