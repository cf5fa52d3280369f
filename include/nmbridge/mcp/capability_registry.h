#pragma once

#include <nmbridge/core/types.h>
#include <nmbridge/mcp/error_handling.h>

#include <nlohmann/json.hpp>

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nmbridge::mcp {

using json = nlohmann::json;

// Wrap a successful structured tool result in an MCP content array
json wrapToolResult(const json& structured);

// Tool failure as an MCP result: {"content":[{"type":"text","text":message}],"isError":true}
json toolErrorResult(const std::string& message);

struct ToolDescriptor {
    using Handler = std::function<Result<json>(const json& args)>;

    std::string name;
    std::string description;
    json inputSchema = json{{"type", "object"}, {"properties", json::object()}};
    // Returns either a full MCP tool result (object with "content") or a value to be wrapped
    Handler handler;
};

struct ResourceDescriptor {
    using Reader = std::function<Result<std::string>(const std::string& uri)>;

    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType = "application/json";
    Reader reader;
};

/**
 * Declarative set of tools and resources. Populated once during startup; afterwards only read.
 * Registration of a duplicate name or URI fails and the caller treats it as fatal.
 */
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    Result<void> registerTool(ToolDescriptor descriptor);
    Result<void> registerResource(ResourceDescriptor descriptor);

    // {"tools":[{name, description, inputSchema}]} in registration order
    json listTools() const;
    // {"resources":[{uri, name, description, mimeType}]} in registration order
    json listResources() const;

    // Always returns a terminating MCP tool result; failures carry "isError": true
    json callTool(const std::string& name, const json& arguments) const;

    // {"contents":[{uri, mimeType, text}]}
    Result<json> readResource(const std::string& uri) const;

    bool hasTool(const std::string& name) const;
    bool hasResource(const std::string& uri) const;
    size_t toolCount() const;
    size_t resourceCount() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ToolDescriptor> tools_;
    std::unordered_map<std::string, ResourceDescriptor> resources_;
    std::vector<std::string> toolOrder_;
    std::vector<std::string> resourceOrder_;
};

} // namespace nmbridge::mcp
