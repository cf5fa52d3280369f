#include <nmbridge/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <vector>

namespace nmbridge::mcp {

json MCPServer::initialize(const json& params, InFlightSession* session) {
    static const std::vector<std::string> kSupported = {"2025-06-18", "2025-03-26", "2024-11-05"};
    const std::string latest = kSupported.front();

    std::string requested = latest;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    spdlog::debug("MCP client requested protocol version: {}", requested);

    // Negotiate (fallback to latest if unsupported)
    std::string negotiated = latest;
    if (std::find(kSupported.begin(), kSupported.end(), requested) != kSupported.end()) {
        negotiated = requested;
    }

    ClientInfo client;
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& info = params["clientInfo"];
        if (info.contains("name") && info["name"].is_string())
            client.name = info["name"].get<std::string>();
        if (info.contains("version") && info["version"].is_string())
            client.version = info["version"].get<std::string>();
    }
    spdlog::info("MCP client '{}' {} initialized with protocol {}", client.name, client.version,
                 negotiated);

    if (session) {
        session->client = client;
        session->protocolVersion = negotiated;
        if (params.contains("capabilities") && params["capabilities"].is_object()) {
            session->clientCapabilities = params["capabilities"];
        }
    }

    return json{{"protocolVersion", negotiated},
                {"serverInfo",
                 {{"name", info_.name}, {"version", info_.version}, {"runMode", info_.runMode}}},
                {"capabilities", buildServerCapabilities()}};
}

json MCPServer::buildServerCapabilities() const {
    return json{{"tools", {{"listChanged", false}}},
                {"resources", {{"subscribe", false}, {"listChanged", false}}},
                {"logging", json::object()}};
}

} // namespace nmbridge::mcp
