#include <gtest/gtest.h>

#include <nmbridge/mcp/capability_registry.h>

#include <stdexcept>

using namespace nmbridge;
using namespace nmbridge::mcp;

namespace {

ToolDescriptor makeTool(const std::string& name, ToolDescriptor::Handler handler) {
    ToolDescriptor tool;
    tool.name = name;
    tool.description = "tool " + name;
    tool.handler = std::move(handler);
    return tool;
}

ResourceDescriptor makeResource(const std::string& uri, std::string mime,
                                ResourceDescriptor::Reader reader) {
    ResourceDescriptor res;
    res.uri = uri;
    res.name = uri;
    res.description = "resource";
    res.mimeType = std::move(mime);
    res.reader = std::move(reader);
    return res;
}

} // namespace

TEST(CapabilityRegistryTest, ListsToolsInRegistrationOrder) {
    CapabilityRegistry registry;
    auto ok = [](const json&) -> Result<json> { return json("ok"); };
    ASSERT_TRUE(registry.registerTool(makeTool("zeta", ok)));
    ASSERT_TRUE(registry.registerTool(makeTool("alpha", ok)));

    auto listed = registry.listTools();
    ASSERT_EQ(listed["tools"].size(), 2u);
    EXPECT_EQ(listed["tools"][0]["name"], "zeta");
    EXPECT_EQ(listed["tools"][1]["name"], "alpha");
    EXPECT_EQ(listed["tools"][0]["inputSchema"]["type"], "object");
    EXPECT_EQ(registry.toolCount(), 2u);
}

TEST(CapabilityRegistryTest, RejectsDuplicatesAndIncompleteDescriptors) {
    CapabilityRegistry registry;
    auto ok = [](const json&) -> Result<json> { return json::object(); };
    ASSERT_TRUE(registry.registerTool(makeTool("navigate_to", ok)));

    auto dup = registry.registerTool(makeTool("navigate_to", ok));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::AlreadyExists);

    EXPECT_FALSE(registry.registerTool(makeTool("", ok)));
    EXPECT_FALSE(registry.registerTool(makeTool("no_handler", nullptr)));

    auto reader = [](const std::string&) -> Result<std::string> { return std::string("x"); };
    ASSERT_TRUE(registry.registerResource(makeResource("browser://a", "text/plain", reader)));
    EXPECT_FALSE(registry.registerResource(makeResource("browser://a", "text/plain", reader)));
    EXPECT_EQ(registry.resourceCount(), 1u);
}

TEST(CapabilityRegistryTest, StructuredResultIsWrappedAsText) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.registerTool(makeTool("obj", [](const json& args) -> Result<json> {
        return json{{"seen", args.value("x", 0)}};
    })));
    ASSERT_TRUE(registry.registerTool(
        makeTool("str", [](const json&) -> Result<json> { return json("plain text"); })));

    auto obj = registry.callTool("obj", json{{"x", 3}});
    EXPECT_FALSE(obj.contains("isError"));
    EXPECT_EQ(obj["content"][0]["type"], "text");
    EXPECT_EQ(json::parse(obj["content"][0]["text"].get<std::string>())["seen"], 3);

    auto str = registry.callTool("str", json::object());
    EXPECT_EQ(str["content"][0]["text"], "plain text");
}

TEST(CapabilityRegistryTest, FullToolResultPassesThrough) {
    CapabilityRegistry registry;
    const json full{{"content", json::array({json{{"type", "text"}, {"text", "done"}}})}};
    ASSERT_TRUE(registry.registerTool(
        makeTool("full", [full](const json&) -> Result<json> { return full; })));
    EXPECT_EQ(registry.callTool("full", json::object()), full);
}

TEST(CapabilityRegistryTest, FailuresBecomeErrorResults) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.registerTool(makeTool("fails", [](const json&) -> Result<json> {
        return Error{ErrorCode::Timeout, "RPC request timeout: click_element (id: req_1)"};
    })));
    ASSERT_TRUE(registry.registerTool(makeTool(
        "throws", [](const json&) -> Result<json> { throw std::runtime_error("kaput"); })));

    auto failed = registry.callTool("fails", json::object());
    EXPECT_TRUE(failed["isError"].get<bool>());
    EXPECT_EQ(failed["content"][0]["text"], "RPC request timeout: click_element (id: req_1)");

    auto thrown = registry.callTool("throws", json::object());
    EXPECT_TRUE(thrown["isError"].get<bool>());
    EXPECT_EQ(thrown["content"][0]["text"], "Tool execution failed: kaput");

    auto unknown = registry.callTool("missing", json::object());
    EXPECT_TRUE(unknown["isError"].get<bool>());
    EXPECT_EQ(unknown["content"][0]["text"], "Unknown tool: missing");
}

TEST(CapabilityRegistryTest, NullArgumentsBecomeEmptyObject) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.registerTool(makeTool("args", [](const json& args) -> Result<json> {
        return json(args.is_object() ? "object" : "other");
    })));
    EXPECT_EQ(registry.callTool("args", json())["content"][0]["text"], "object");
}

TEST(CapabilityRegistryTest, ReadResourceReturnsContents) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.registerResource(makeResource(
        "browser://dom/state", "text/markdown",
        [](const std::string& uri) -> Result<std::string> { return "# " + uri; })));
    ASSERT_TRUE(registry.registerResource(
        makeResource("browser://broken", "application/json",
                     [](const std::string&) -> Result<std::string> {
                         return Error{ErrorCode::NetworkError, "companion gone"};
                     })));

    auto read = registry.readResource("browser://dom/state");
    ASSERT_TRUE(read);
    const auto& entry = read.value()["contents"][0];
    EXPECT_EQ(entry["uri"], "browser://dom/state");
    EXPECT_EQ(entry["mimeType"], "text/markdown");
    EXPECT_EQ(entry["text"], "# browser://dom/state");

    auto broken = registry.readResource("browser://broken");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().message, "companion gone");

    auto missing = registry.readResource("browser://nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto listed = registry.listResources();
    ASSERT_EQ(listed["resources"].size(), 2u);
    EXPECT_EQ(listed["resources"][0]["mimeType"], "text/markdown");
}
