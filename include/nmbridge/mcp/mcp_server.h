#pragma once

#include <nmbridge/core/types.h>
#include <nmbridge/mcp/capability_registry.h>
#include <nmbridge/mcp/error_handling.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nmbridge::mcp {

using json = nlohmann::json;

// Process identity surfaced in the initialize handshake and in companion status replies
struct HostInfo {
    std::string name;
    std::string version;
    std::string runMode = "production";
};

struct ClientInfo {
    std::string name = "unknown";
    std::string version = "unknown";
};

/**
 * One connected MCP client. Created on SSE connect or on initialize over plain HTTP; dropped on
 * disconnect. Session-scoped state is owned by the session and never outlives it.
 */
struct InFlightSession {
    std::string id;
    SteadyTimePoint createdAt = std::chrono::steady_clock::now();
    ClientInfo client;
    std::string protocolVersion;
    json clientCapabilities = json::object();
    bool initialized = false;
    // Free-form per-session state (e.g. the companion tab the client last targeted)
    json state = json::object();
};

/**
 * Transport-independent MCP protocol handling: JSON-RPC validation, the initialize handshake and
 * routing of discovery and invocation methods to the capability registry.
 */
class MCPServer {
public:
    explicit MCPServer(HostInfo info);
    MCPServer(HostInfo info, std::shared_ptr<CapabilityRegistry> registry);

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Startup wiring; failure is fatal to the caller
    Result<void> registerTool(ToolDescriptor descriptor);
    Result<void> registerResource(ResourceDescriptor descriptor);

    // Handle one JSON-RPC message. Returns std::nullopt for notifications.
    std::optional<json> handleRequest(const json& request, InFlightSession* session = nullptr);

    // Shutdown support: refuse new calls, then wait for the ones already running
    void beginDrain();
    bool isDraining() const noexcept { return draining_.load(); }
    bool waitForIdle(std::chrono::milliseconds timeout);
    size_t inFlightCalls() const noexcept { return inFlight_.load(); }

    const HostInfo& hostInfo() const noexcept { return info_; }
    CapabilityRegistry& registry() noexcept { return *registry_; }
    const CapabilityRegistry& registry() const noexcept { return *registry_; }

    static json createResponse(const json& id, const json& result);
    static json createError(const json& id, int code, const std::string& message);

private:
    std::optional<json> dispatchCoreMethod(const json& id, const std::string& method,
                                           const json& params, InFlightSession* session);
    json initialize(const json& params, InFlightSession* session);
    json buildServerCapabilities() const;
    json handleToolCall(const json& id, const json& params);
    json handleResourceRead(const json& id, const json& params);

    // Counts a tool or resource call for the duration of its execution
    class InFlightGuard {
    public:
        explicit InFlightGuard(MCPServer& server);
        ~InFlightGuard();
        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

    private:
        MCPServer& server_;
    };

    HostInfo info_;
    std::shared_ptr<CapabilityRegistry> registry_;

    std::atomic<bool> draining_{false};
    std::atomic<size_t> inFlight_{0};
    std::mutex idleMutex_;
    std::condition_variable idleCv_;
};

} // namespace nmbridge::mcp
