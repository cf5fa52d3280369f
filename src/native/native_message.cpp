#include <nmbridge/native/native_message.h>

namespace nmbridge::native {

namespace {

// Correlation ids are strings on the wire; tolerate numeric ids from older companions
std::string idToString(const json& id) {
    if (id.is_string())
        return id.get<std::string>();
    if (id.is_null())
        return {};
    return id.dump();
}

std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace

Result<json> parseJson(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }
    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

Result<InboundMessage> classifyMessage(const json& msg) {
    if (!msg.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }
    auto typeIt = msg.find("type");
    if (typeIt == msg.end() || !typeIt->is_string()) {
        return Error{ErrorCode::InvalidData, "Missing 'type' field"};
    }
    const auto type = typeIt->get<std::string>();

    if (type == message_type::RPC_RESPONSE) {
        RpcReply reply;
        reply.id = idToString(msg.value("id", json{}));
        if (reply.id.empty()) {
            return Error{ErrorCode::InvalidData, "rpc_response without id"};
        }
        if (auto it = msg.find("error"); it != msg.end() && it->is_object()) {
            RpcError err;
            // Non-integer codes are kept in the message rather than failing the reply
            if (auto cit = it->find("code"); cit != it->end()) {
                if (cit->is_number_integer())
                    err.code = cit->get<int>();
                else if (cit->is_string())
                    err.message = cit->get<std::string>();
            }
            if (auto msgText = stringField(*it, "message"); !msgText.empty())
                err.message = err.message.empty() ? msgText
                                                  : msgText + " (" + err.message + ")";
            reply.error = std::move(err);
        } else if (auto rit = msg.find("result"); rit != msg.end()) {
            reply.result = *rit;
        }
        return InboundMessage{std::move(reply)};
    }

    if (type == message_type::RPC_REQUEST) {
        RpcCall call;
        call.id = idToString(msg.value("id", json{}));
        call.method = stringField(msg, "method");
        if (call.method.empty()) {
            return Error{ErrorCode::InvalidData, "rpc_request without method"};
        }
        call.params = msg.value("params", json::object());
        return InboundMessage{std::move(call)};
    }

    PushMessage push;
    push.type = type;
    push.data = msg.value("data", json{});
    push.raw = msg;
    return InboundMessage{std::move(push)};
}

json toJson(const RpcCall& call) {
    json j = {{"type", message_type::RPC_REQUEST}, {"id", call.id}, {"method", call.method}};
    if (!call.params.is_null()) {
        j["params"] = call.params;
    }
    return j;
}

json toJson(const RpcReply& reply) {
    json j = {{"type", message_type::RPC_RESPONSE}, {"id", reply.id}};
    if (reply.error) {
        j["error"] = {{"code", reply.error->code}, {"message", reply.error->message}};
    } else {
        j["result"] = reply.result.value_or(json(nullptr));
    }
    return j;
}

json makeErrorMessage(const std::string& message) {
    return json{{"type", message_type::ERROR}, {"error", {{"message", message}}}};
}

} // namespace nmbridge::native
