#pragma once

#include <nlohmann/json.hpp>
#include <nmbridge/core/types.h>

#include <concepts>
#include <string>
#include <string_view>

namespace nmbridge::mcp {

using json = nlohmann::json;

template <typename T> using MCPResult = Result<T>;

// Concept for JSON-RPC message validation
template <typename T>
concept JsonRPCMessage = requires(T msg) {
    { msg.is_object() } -> std::same_as<bool>;
    { msg.contains("jsonrpc") } -> std::same_as<bool>;
};

// Protocol constants
namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_PING = "ping";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";
constexpr std::string_view METHOD_RESOURCES_LIST = "resources/list";
constexpr std::string_view METHOD_RESOURCES_READ = "resources/read";
constexpr std::string_view METHOD_LOGGING_SET_LEVEL = "logging/setLevel";
constexpr std::string_view NOTIFY_RESOURCES_UPDATED = "notifications/resources/updated";

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
// Implementation-defined server error range
constexpr int SERVER_SHUTTING_DOWN = -32000;
} // namespace protocol

namespace json_utils {

// Validate JSON-RPC message structure
template <JsonRPCMessage Msg> MCPResult<json> validate_jsonrpc_message(const Msg& msg) noexcept {
    if (!msg.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }
    if (!msg.contains("jsonrpc")) {
        return Error{ErrorCode::InvalidData, "Missing 'jsonrpc' field"};
    }
    const auto& version = msg["jsonrpc"];
    if (!version.is_string() || version.template get<std::string>() != protocol::JSONRPC_VERSION) {
        return Error{ErrorCode::InvalidData, "Invalid or missing jsonrpc version"};
    }
    if (!msg.contains("method") || !msg["method"].is_string()) {
        return Error{ErrorCode::InvalidData, "Missing 'method' field"};
    }
    return msg;
}

} // namespace json_utils

} // namespace nmbridge::mcp
