#pragma once

#include <nmbridge/config/host_config.h>
#include <nmbridge/core/types.h>
#include <nmbridge/host/control_handlers.h>
#include <nmbridge/host/lifecycle.h>

#include <memory>

#include <unistd.h>

namespace nmbridge::native {
class NativeTransport;
class CorrelationManager;
} // namespace nmbridge::native

namespace nmbridge::mcp {
class MCPServer;
class HttpMcpServer;
} // namespace nmbridge::mcp

namespace nmbridge::host {

/**
 * Owns and wires the host's components: native transport, correlation manager, MCP server with
 * the browser capabilities, HTTP/SSE endpoint, control handlers and the lifecycle coordinator.
 *
 * start() brings everything up and registers the shutdown steps; run() blocks until a shutdown
 * trigger fires and returns the exit code.
 */
class BridgeHost {
public:
    struct Options {
        config::HostConfig config;
        int inputFd = STDIN_FILENO;
        int outputFd = STDOUT_FILENO;
    };

    explicit BridgeHost(Options options);
    ~BridgeHost();

    BridgeHost(const BridgeHost&) = delete;
    BridgeHost& operator=(const BridgeHost&) = delete;

    // Any failure here is a startup failure; components already started are stopped again
    Result<void> start();
    int run();

    LifecycleCoordinator& lifecycle() noexcept { return lifecycle_; }
    std::shared_ptr<native::NativeTransport> transport() const { return transport_; }
    std::shared_ptr<native::CorrelationManager> correlation() const { return correlation_; }
    std::shared_ptr<mcp::MCPServer> mcpServer() const { return mcp_; }
    std::shared_ptr<mcp::HttpMcpServer> httpServer() const { return http_; }
    const config::HostConfig& config() const noexcept { return opts_.config; }

private:
    void wireTransport();
    void registerShutdownSteps();

    Options opts_;
    LifecycleCoordinator lifecycle_;
    std::shared_ptr<native::NativeTransport> transport_;
    std::shared_ptr<native::CorrelationManager> correlation_;
    std::shared_ptr<mcp::MCPServer> mcp_;
    std::shared_ptr<mcp::HttpMcpServer> http_;
    std::unique_ptr<ControlHandlers> control_;
    bool started_ = false;
};

} // namespace nmbridge::host
