#include <nmbridge/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

namespace nmbridge::mcp {

namespace {

std::string stringParam(const json& params, const char* key) {
    if (!params.is_object())
        return {};
    auto it = params.find(key);
    if (it == params.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace

MCPServer::MCPServer(HostInfo info)
    : MCPServer(std::move(info), std::make_shared<CapabilityRegistry>()) {}

MCPServer::MCPServer(HostInfo info, std::shared_ptr<CapabilityRegistry> registry)
    : info_(std::move(info)),
      registry_(registry ? std::move(registry) : std::make_shared<CapabilityRegistry>()) {}

Result<void> MCPServer::registerTool(ToolDescriptor descriptor) {
    return registry_->registerTool(std::move(descriptor));
}

Result<void> MCPServer::registerResource(ResourceDescriptor descriptor) {
    return registry_->registerResource(std::move(descriptor));
}

std::optional<json> MCPServer::handleRequest(const json& request, InFlightSession* session) {
    const auto id = request.is_object() ? request.value("id", json{}) : json{};
    auto valid = json_utils::validate_jsonrpc_message(request);
    if (!valid) {
        spdlog::debug("MCP invalid request: {}", valid.error().message);
        return createError(id, protocol::INVALID_REQUEST, valid.error().message);
    }

    const bool isNotification = !request.contains("id");
    const std::string method = request["method"].get<std::string>();
    const json params = request.value("params", json::object());

    try {
        auto response = dispatchCoreMethod(id, method, params, session);
        if (isNotification) {
            return std::nullopt;
        }
        if (!response) {
            spdlog::debug("MCP method not found: {}", method);
            return createError(id, protocol::METHOD_NOT_FOUND, "Method not found: " + method);
        }
        return response;
    } catch (const std::exception& e) {
        spdlog::error("MCP handler for '{}' threw: {}", method, e.what());
        if (isNotification) {
            return std::nullopt;
        }
        return createError(id, protocol::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handleToolCall(const json& id, const json& params) {
    const auto toolName = stringParam(params, "name");
    if (toolName.empty()) {
        return createError(id, protocol::INVALID_PARAMS, "Missing tool name");
    }
    // Counted before the drain check so waitForIdle never misses a call that gets through
    InFlightGuard guard(*this);
    if (draining_.load()) {
        return createError(id, protocol::SERVER_SHUTTING_DOWN, "Server is shutting down");
    }
    const auto toolArgs = params.value("arguments", json::object());
    spdlog::debug("MCP tool call: '{}' with args: {}", toolName, toolArgs.dump());
    return createResponse(id, registry_->callTool(toolName, toolArgs));
}

json MCPServer::handleResourceRead(const json& id, const json& params) {
    const auto uri = stringParam(params, "uri");
    if (uri.empty()) {
        return createError(id, protocol::INVALID_PARAMS, "Missing resource uri");
    }
    InFlightGuard guard(*this);
    if (draining_.load()) {
        return createError(id, protocol::SERVER_SHUTTING_DOWN, "Server is shutting down");
    }
    auto contents = registry_->readResource(uri);
    if (!contents) {
        const int code = contents.error().code == ErrorCode::NotFound ? protocol::INVALID_PARAMS
                                                                       : protocol::INTERNAL_ERROR;
        return createError(id, code, contents.error().message);
    }
    return createResponse(id, contents.value());
}

void MCPServer::beginDrain() {
    if (!draining_.exchange(true)) {
        spdlog::info("MCP server draining ({} call(s) in flight)", inFlight_.load());
    }
}

bool MCPServer::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return inFlight_.load() == 0; });
}

MCPServer::InFlightGuard::InFlightGuard(MCPServer& server) : server_(server) {
    server_.inFlight_.fetch_add(1);
}

MCPServer::InFlightGuard::~InFlightGuard() {
    if (server_.inFlight_.fetch_sub(1) == 1) {
        std::lock_guard<std::mutex> lock(server_.idleMutex_);
        server_.idleCv_.notify_all();
    }
}

json MCPServer::createResponse(const json& id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MCPServer::createError(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

} // namespace nmbridge::mcp
