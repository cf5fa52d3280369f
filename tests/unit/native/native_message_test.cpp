#include <gtest/gtest.h>

#include <nmbridge/native/native_message.h>

using namespace nmbridge;
using namespace nmbridge::native;

TEST(NativeMessageTest, ClassifiesReplyWithResult) {
    auto msg = classifyMessage(json{{"type", "rpc_response"}, {"id", "req_1"}, {"result", {{"ok", true}}}});
    ASSERT_TRUE(msg);
    auto* reply = std::get_if<RpcReply>(&msg.value());
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->id, "req_1");
    ASSERT_TRUE(reply->result.has_value());
    EXPECT_TRUE((*reply->result)["ok"].get<bool>());
    EXPECT_FALSE(reply->error.has_value());
}

TEST(NativeMessageTest, ClassifiesReplyWithError) {
    auto msg = classifyMessage(
        json{{"type", "rpc_response"}, {"id", 7}, {"error", {{"code", -1}, {"message", "boom"}}}});
    ASSERT_TRUE(msg);
    const auto& reply = std::get<RpcReply>(msg.value());
    EXPECT_EQ(reply.id, "7");
    ASSERT_TRUE(reply.error.has_value());
    EXPECT_EQ(reply.error->code, -1);
    EXPECT_EQ(reply.error->message, "boom");
}

TEST(NativeMessageTest, MistypedErrorFieldsAreTolerated) {
    auto stringCode = classifyMessage(json{{"type", "rpc_response"},
                                           {"id", "req_1"},
                                           {"error", {{"code", "E_BAD"}, {"message", "x"}}}});
    ASSERT_TRUE(stringCode);
    const auto& reply = std::get<RpcReply>(stringCode.value());
    ASSERT_TRUE(reply.error.has_value());
    EXPECT_EQ(reply.error->code, 0);
    EXPECT_EQ(reply.error->message, "x (E_BAD)");

    auto codeOnly = classifyMessage(
        json{{"type", "rpc_response"}, {"id", "req_2"}, {"error", {{"code", "E_BAD"}, {"message", 5}}}});
    ASSERT_TRUE(codeOnly);
    EXPECT_EQ(std::get<RpcReply>(codeOnly.value()).error->message, "E_BAD");
}

TEST(NativeMessageTest, NonStringMethodIsInvalid) {
    auto msg = classifyMessage(json{{"type", "rpc_request"}, {"id", "a"}, {"method", 42}});
    ASSERT_FALSE(msg);
    EXPECT_EQ(msg.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(msg.error().message, "rpc_request without method");
}

TEST(NativeMessageTest, ReplyWithoutIdIsInvalid) {
    auto msg = classifyMessage(json{{"type", "rpc_response"}, {"result", 1}});
    ASSERT_FALSE(msg);
    EXPECT_EQ(msg.error().code, ErrorCode::InvalidData);
}

TEST(NativeMessageTest, ClassifiesInboundCall) {
    auto msg = classifyMessage(json{{"type", "rpc_request"}, {"id", "ext_1"}, {"method", "status"}});
    ASSERT_TRUE(msg);
    const auto& call = std::get<RpcCall>(msg.value());
    EXPECT_EQ(call.id, "ext_1");
    EXPECT_EQ(call.method, "status");
    EXPECT_TRUE(call.params.is_object());

    EXPECT_FALSE(classifyMessage(json{{"type", "rpc_request"}, {"id", "x"}}));
}

TEST(NativeMessageTest, EverythingElseIsAPush) {
    json raw{{"type", "resource_updated"}, {"data", {{"uri", "browser://dom/state"}}}};
    auto msg = classifyMessage(raw);
    ASSERT_TRUE(msg);
    const auto& push = std::get<PushMessage>(msg.value());
    EXPECT_EQ(push.type, "resource_updated");
    EXPECT_EQ(push.data["uri"], "browser://dom/state");
    EXPECT_EQ(push.raw, raw);

    EXPECT_FALSE(classifyMessage(json{{"data", 1}}));
    EXPECT_FALSE(classifyMessage(json::array()));
}

TEST(NativeMessageTest, OutboundShapes) {
    auto call = toJson(RpcCall{"req_a", "get_dom_state", json::object()});
    EXPECT_EQ(call["type"], "rpc_request");
    EXPECT_EQ(call["id"], "req_a");
    EXPECT_EQ(call["method"], "get_dom_state");

    RpcReply ok;
    ok.id = "ext_1";
    auto okJson = toJson(ok);
    EXPECT_EQ(okJson["type"], "rpc_response");
    EXPECT_TRUE(okJson.contains("result"));
    EXPECT_TRUE(okJson["result"].is_null());

    RpcReply failed;
    failed.id = "ext_2";
    failed.error = RpcError{rpc_error::METHOD_NOT_FOUND, "Method not found: nope"};
    auto errJson = toJson(failed);
    EXPECT_EQ(errJson["error"]["code"], -32601);
    EXPECT_FALSE(errJson.contains("result"));

    auto err = makeErrorMessage("Unknown message type: x");
    EXPECT_EQ(err["type"], "error");
    EXPECT_EQ(err["error"]["message"], "Unknown message type: x");
}

TEST(NativeMessageTest, ParseJsonReportsErrors) {
    EXPECT_FALSE(parseJson(""));
    EXPECT_FALSE(parseJson("{not json"));
    auto ok = parseJson(R"({"a":1})");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value()["a"], 1);
}
