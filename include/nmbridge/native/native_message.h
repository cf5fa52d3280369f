#pragma once

#include <nmbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace nmbridge::native {

using json = nlohmann::json;

// Type discriminators of the companion wire protocol
namespace message_type {
constexpr std::string_view RPC_REQUEST = "rpc_request";
constexpr std::string_view RPC_RESPONSE = "rpc_response";
constexpr std::string_view ERROR = "error";
constexpr std::string_view RESOURCE_UPDATED = "resource_updated";
} // namespace message_type

// Error codes carried in rpc_response.error
namespace rpc_error {
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int SERVER_ERROR = -32000;
} // namespace rpc_error

struct RpcError {
    int code = 0;
    std::string message;
};

// Reply to a request the host issued
struct RpcReply {
    std::string id;
    std::optional<json> result;
    std::optional<RpcError> error;
};

// Request issued by the companion (or by the host, on the outbound path)
struct RpcCall {
    std::string id;
    std::string method;
    json params;
};

// Unsolicited message addressed to a local consumer by its type
struct PushMessage {
    std::string type;
    json data;
    json raw;
};

// Closed set of inbound message categories
using InboundMessage = std::variant<RpcReply, RpcCall, PushMessage>;

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// Safe JSON parsing without exceptions
Result<json> parseJson(std::string_view input) noexcept;

// Classify a decoded frame by its "type" discriminator
Result<InboundMessage> classifyMessage(const json& msg);

json toJson(const RpcCall& call);
json toJson(const RpcReply& reply);

// {"type":"error","error":{"message":...}}
json makeErrorMessage(const std::string& message);

} // namespace nmbridge::native
