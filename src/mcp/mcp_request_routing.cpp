#include <nmbridge/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

namespace nmbridge::mcp {

namespace {

spdlog::level::level_enum parseMcpLogLevel(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info" || level == "notice")
        return spdlog::level::info;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical" || level == "alert" || level == "emergency")
        return spdlog::level::critical;
    return spdlog::level::info;
}

} // namespace

std::optional<json> MCPServer::dispatchCoreMethod(const json& id, const std::string& method,
                                                  const json& params, InFlightSession* session) {
    if (method == protocol::METHOD_INITIALIZE) {
        spdlog::debug("MCP handling initialize request with params: {}", params.dump());
        return createResponse(id, initialize(params, session));
    }

    if (method == protocol::METHOD_INITIALIZED || method == "initialized") {
        if (session) {
            session->initialized = true;
        }
        return json::object();
    }

    if (method == "notifications/cancelled") {
        // Cancellation is advisory; the correlated companion call still runs to its timeout
        spdlog::debug("MCP cancellation notice for request {}",
                      params.value("requestId", json{}).dump());
        return json::object();
    }

    if (method == protocol::METHOD_PING) {
        return createResponse(id, json::object());
    }

    if (method == protocol::METHOD_TOOLS_LIST) {
        return createResponse(id, registry_->listTools());
    }

    if (method == protocol::METHOD_TOOLS_CALL) {
        return handleToolCall(id, params);
    }

    if (method == protocol::METHOD_RESOURCES_LIST) {
        return createResponse(id, registry_->listResources());
    }

    if (method == protocol::METHOD_RESOURCES_READ) {
        return handleResourceRead(id, params);
    }

    if (method == protocol::METHOD_LOGGING_SET_LEVEL) {
        std::string level = "info";
        if (params.contains("level") && params["level"].is_string())
            level = params["level"].get<std::string>();
        spdlog::set_level(parseMcpLogLevel(level));
        return createResponse(id, json::object());
    }

    return std::nullopt;
}

} // namespace nmbridge::mcp
