#pragma once

#include <nmbridge/browser/dom_state.h>
#include <nmbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace nmbridge::mcp {
class MCPServer;
}

namespace nmbridge::native {
class CorrelationManager;
}

namespace nmbridge::browser {

namespace uri {
constexpr const char* DOM_STATE = "browser://dom/state";
constexpr const char* CURRENT_STATE = "browser://current/state";
} // namespace uri

// Blocking request to the companion: method, params, timeout -> reply result
using CompanionCall = std::function<Result<json>(const std::string& method, const json& params,
                                                 std::chrono::milliseconds timeout)>;

// Tool request DTOs. fromJson validates and applies defaults.
struct NavigateRequest {
    using RequestType = NavigateRequest;

    std::string url;
    std::optional<int> timeoutMs; // nullopt means "auto"

    static Result<NavigateRequest> fromJson(const json& j);
    json toJson() const;
};

struct ClickElementRequest {
    using RequestType = ClickElementRequest;

    int elementIndex = 0;
    int waitAfterMs = 1000;
    bool returnDomState = false;

    static Result<ClickElementRequest> fromJson(const json& j);
    json toJson() const;
};

struct TypeValueRequest {
    using RequestType = TypeValueRequest;

    int elementIndex = 0;
    json value;
    std::optional<int> timeoutMs; // nullopt means "auto"
    bool clearFirst = true;
    bool submit = false;
    double waitAfterSeconds = 1.0;

    static Result<TypeValueRequest> fromJson(const json& j);
    json toJson() const;
};

struct ScrollPageRequest {
    using RequestType = ScrollPageRequest;

    std::string action;
    int pixels = 300;
    std::optional<int> elementIndex;

    static Result<ScrollPageRequest> fromJson(const json& j);
    json toJson() const;
};

struct ManageTabsRequest {
    using RequestType = ManageTabsRequest;

    std::string action;
    std::optional<std::string> tabId;
    std::optional<std::string> url;
    std::optional<bool> background;

    static Result<ManageTabsRequest> fromJson(const json& j);
    json toJson() const;
};

// True when a string value carries a {Key} or {Modifier+Key} sequence
bool containsSpecialKeyPattern(const json& value);

// Timeout for typing `value`, scaled by length and keyboard mode, clamped to 15 s .. 10 min
int computeTypeValueTimeout(const json& value, bool keyboardMode);

// Extra RPC headroom on top of a typing timeout: 25 %, clamped to 15 s .. 60 s
int computeTypeValueBuffer(int timeoutMs);

/**
 * Browser automation tools and resources. Every operation is a correlated call to the companion;
 * validation happens locally before anything is sent.
 */
class BrowserCapabilities {
public:
    explicit BrowserCapabilities(CompanionCall call);
    explicit BrowserCapabilities(std::shared_ptr<native::CorrelationManager> correlation);

    // Register all tools and resources. Fails on the first duplicate.
    Result<void> registerWith(mcp::MCPServer& server) const;

    Result<json> navigateTo(const json& args) const;
    Result<json> clickElement(const json& args) const;
    Result<json> typeValue(const json& args) const;
    Result<json> scrollPage(const json& args) const;
    Result<json> manageTabs(const json& args) const;
    Result<json> getDomExtraElements(const json& args) const;

    Result<std::string> readDomState(const std::string& uri) const;
    Result<std::string> readCurrentState(const std::string& uri) const;

private:
    Result<DomState> fetchDomState() const;

    CompanionCall call_;
};

} // namespace nmbridge::browser
