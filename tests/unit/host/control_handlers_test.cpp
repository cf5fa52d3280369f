#include <gtest/gtest.h>

#include <nmbridge/host/control_handlers.h>
#include <nmbridge/native/native_transport.h>

#include "fake_companion.h"

#include <chrono>
#include <regex>

using namespace nmbridge;
using namespace nmbridge::host;
using namespace std::chrono_literals;
using nmbridge::test::FakeCompanion;

namespace {

ControlHandlers::Context makeContext() {
    ControlHandlers::Context ctx;
    ctx.name = "ai.algonius.mcp.host";
    ctx.version = "0.1.0";
    ctx.runMode = "test";
    ctx.sseBaseUrl = "http://127.0.0.1:9333";
    ctx.ssePort = [] { return uint16_t{9333}; };
    ctx.pendingRequests = [] { return size_t{2}; };
    return ctx;
}

} // namespace

TEST(ControlHandlersTest, StatusReportsIdentityAndRuntime) {
    LifecycleCoordinator lifecycle;
    lifecycle.markRunning();
    ControlHandlers control(makeContext(), lifecycle);

    auto status = control.status(json::object());
    ASSERT_TRUE(status);
    const auto& s = status.value();
    EXPECT_EQ(s["status"], "running");
    EXPECT_EQ(s["name"], "ai.algonius.mcp.host");
    EXPECT_EQ(s["version"], "0.1.0");
    EXPECT_EQ(s["run_mode"], "test");
    EXPECT_EQ(s["sse_port"], 9333);
    EXPECT_EQ(s["sse_base_url"], "http://127.0.0.1:9333");
    EXPECT_EQ(s["pending_requests"], 2);
    EXPECT_EQ(s["initialized"], false);
    EXPECT_EQ(s["uptime"], "0s");
    EXPECT_GE(s["uptime_seconds"].get<int64_t>(), 0);

    const std::regex rfc3339(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(s["start_time"].get<std::string>(), rfc3339));
    EXPECT_TRUE(std::regex_match(s["current_time"].get<std::string>(), rfc3339));
}

TEST(ControlHandlersTest, InitIsIdempotentAndCounted) {
    LifecycleCoordinator lifecycle;
    ControlHandlers control(makeContext(), lifecycle);

    auto first = control.init(json{{"capabilities", {"tabs"}}});
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value()["status"], "initialized");
    EXPECT_EQ(first.value()["init_count"], 1);

    auto second = control.init(json::object());
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value()["init_count"], 2);
    EXPECT_EQ(second.value()["first_init_time"], first.value()["first_init_time"]);

    EXPECT_TRUE(control.initialized());
    EXPECT_EQ(control.initCount(), 2);
    EXPECT_EQ(control.status(json::object()).value()["initialized"], true);
}

TEST(ControlHandlersTest, ShutdownFiresTheLifecycleSignal) {
    LifecycleCoordinator lifecycle;
    ControlHandlers control(makeContext(), lifecycle);

    auto ack = control.shutdown(json::object());
    ASSERT_TRUE(ack);
    EXPECT_EQ(ack.value()["status"], "shutting_down");
    EXPECT_TRUE(lifecycle.signal().fired());
    EXPECT_EQ(lifecycle.shutdownReason(), ShutdownReason::ControlRequest);

    // A second request is acknowledged but does not change the reason
    EXPECT_TRUE(control.shutdown(json::object()));
    EXPECT_EQ(lifecycle.shutdownReason(), ShutdownReason::ControlRequest);
}

TEST(ControlHandlersTest, ServedOverTheNativeTransport) {
    FakeCompanion companion;
    companion.start();

    LifecycleCoordinator lifecycle;
    ControlHandlers control(makeContext(), lifecycle);

    native::NativeTransport::Config cfg;
    cfg.inputFd = companion.hostInputFd();
    cfg.outputFd = companion.hostOutputFd();
    native::NativeTransport transport(cfg);
    control.registerWith(transport);
    ASSERT_TRUE(transport.start());

    companion.send({{"type", "rpc_request"}, {"id", "c1"}, {"method", "status"}});
    ASSERT_TRUE(companion.waitForMessages(1, 2s));
    auto reply = companion.received().front();
    EXPECT_EQ(reply["id"], "c1");
    EXPECT_EQ(reply["result"]["name"], "ai.algonius.mcp.host");
    EXPECT_EQ(reply["result"]["status"], "starting");

    companion.send({{"type", "rpc_request"}, {"id", "c2"}, {"method", "shutdown"}});
    ASSERT_TRUE(companion.waitForMessages(2, 2s));
    EXPECT_EQ(companion.received()[1]["result"]["status"], "shutting_down");
    EXPECT_TRUE(lifecycle.signal().waitFor(1s));

    transport.stop();
}
