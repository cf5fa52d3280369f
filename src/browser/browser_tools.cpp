#include <nmbridge/browser/browser_tools.h>
#include <nmbridge/mcp/mcp_server.h>
#include <nmbridge/native/correlation_manager.h>

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <vector>

namespace nmbridge::browser {

namespace {

using namespace std::chrono_literals;

constexpr auto kDomStateTimeout = 5000ms;
constexpr auto kCurrentStateTimeout = 5000ms;
constexpr auto kNavigateAutoTimeout = 60000ms;
constexpr auto kNavigateBuffer = 5000ms;
constexpr auto kClickBaseTimeout = 10000ms;
constexpr auto kScrollTimeout = 10000ms;
constexpr auto kTabsTimeout = 10000ms;

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

// Any JSON number; fractional values truncate
Result<int> requireInt(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null())
        return invalid(fmt::format("{} is required", key));
    if (!it->is_number())
        return invalid(fmt::format("{} must be a number, got: {}", key, it->type_name()));
    auto n = numberToInt(*it);
    if (!n)
        return invalid(fmt::format("{} is out of range, got: {}", key, it->dump()));
    return *n;
}

Result<std::optional<int>> parseTimeout(const json& args, int minMs, int maxMs) {
    auto it = args.find("timeout");
    if (it == args.end() || it->is_null())
        return std::optional<int>{};
    int ms = 0;
    if (it->is_string()) {
        const auto s = it->get<std::string>();
        if (s == "auto")
            return std::optional<int>{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), ms);
        if (ec != std::errc{} || ptr != s.data() + s.size())
            return invalid("timeout must be 'auto' or a timeout in milliseconds");
    } else if (it->is_number()) {
        auto n = numberToInt(*it);
        if (!n)
            return invalid(
                fmt::format("timeout must be between {} and {} milliseconds", minMs, maxMs));
        ms = *n;
    } else {
        return invalid("timeout must be 'auto' or a timeout in milliseconds");
    }
    if (ms < minMs || ms > maxMs)
        return invalid(
            fmt::format("timeout must be between {} and {} milliseconds", minMs, maxMs));
    return std::optional<int>{ms};
}

Result<std::optional<bool>> optionalBool(const json& args, const char* key,
                                         const std::string& label) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null())
        return std::optional<bool>{};
    if (!it->is_boolean())
        return invalid(fmt::format("{} must be a boolean", label));
    return std::optional<bool>{it->get<bool>()};
}

// A companion reply with "success": false is a failed operation even though the RPC succeeded
Result<void> checkCompanionOutcome(const json& reply, const std::string& fallback) {
    if (!reply.is_object())
        return Result<void>();
    auto it = reply.find("success");
    if (it == reply.end() || !it->is_boolean() || it->get<bool>())
        return Result<void>();
    std::string message = fallback;
    if (auto m = reply.find("message"); m != reply.end() && m->is_string())
        message = m->get<std::string>();
    if (auto code = reply.find("error_code"); code != reply.end() && code->is_string())
        message += " (" + code->get<std::string>() + ")";
    return Error{ErrorCode::RemoteError, message};
}

std::string replyString(const json& reply, const char* key, std::string fallback = {}) {
    if (reply.is_object()) {
        auto it = reply.find(key);
        if (it != reply.end() && it->is_string())
            return it->get<std::string>();
    }
    return fallback;
}

bool replyFlag(const json& reply, const char* key) {
    if (!reply.is_object())
        return false;
    auto it = reply.find(key);
    return it != reply.end() && it->is_boolean() && it->get<bool>();
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string valueText(const json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

json navigateSchema() {
    return json{{"type", "object"},
                {"properties",
                 {{"url", {{"type", "string"}, {"description", "URL to navigate to (http or https)"}}},
                  {"timeout",
                   {{"type", "string"},
                    {"description", "'auto' to wait for page load, or a timeout in milliseconds "
                                    "between 1000 and 120000"},
                    {"default", "auto"}}}}},
                {"required", json::array({"url"})}};
}

json clickSchema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"element_index",
           {{"type", "number"},
            {"description", "Index of the element to click (from DOM state interactive elements)"},
            {"minimum", 0}}},
          {"wait_after",
           {{"type", "number"},
            {"description", "Milliseconds to wait after clicking for the page to settle"},
            {"minimum", 0},
            {"maximum", 30000},
            {"default", 1000}}},
          {"return_dom_state",
           {{"type", "boolean"},
            {"description", "Append the refreshed DOM overview when the click changed the page"},
            {"default", false}}}}},
        {"required", json::array({"element_index"})},
        {"additionalProperties", false}};
}

json typeValueSchema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"element_index",
           {{"type", "number"},
            {"description", "Index of the element to type into (0-based, from DOM state)"},
            {"minimum", 0}}},
          {"value",
           {{"description", "Value to set. Special keys use {Enter}, {Tab} or {Ctrl+A} syntax."}}},
          {"timeout",
           {{"type", "string"},
            {"description", "'auto' to scale with input length, or milliseconds (5000..600000)"},
            {"default", "auto"}}},
          {"options",
           {{"type", "object"},
            {"properties",
             {{"clear_first",
               {{"type", "boolean"},
                {"description", "Clear existing content first"},
                {"default", true}}},
              {"submit",
               {{"type", "boolean"},
                {"description", "Submit the form after setting the value"},
                {"default", false}}},
              {"wait_after",
               {{"type", "number"},
                {"description", "Seconds to wait after setting the value"},
                {"minimum", 0},
                {"maximum", 30},
                {"default", 1}}}}},
            {"additionalProperties", false}}}}},
        {"required", json::array({"element_index", "value"})},
        {"additionalProperties", false}};
}

json scrollSchema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"},
            {"enum", json::array({"up", "down", "to_top", "to_bottom", "to_element"})},
            {"description", "Scroll direction or target"}}},
          {"pixels",
           {{"type", "number"},
            {"description", "Pixels to scroll for up/down"},
            {"minimum", 1},
            {"default", 300}}},
          {"element_index",
           {{"type", "number"},
            {"description", "Element to scroll into view (required for to_element)"},
            {"minimum", 0}}}}},
        {"required", json::array({"action"})}};
}

json manageTabsSchema() {
    return json{{"type", "object"},
                {"properties",
                 {{"action",
                   {{"type", "string"},
                    {"enum", json::array({"switch", "open", "close"})},
                    {"description", "Tab operation"}}},
                  {"tab_id",
                   {{"type", "string"}, {"description", "Target tab id (switch and close)"}}},
                  {"url", {{"type", "string"}, {"description", "URL to open (open)"}}},
                  {"background",
                   {{"type", "boolean"},
                    {"description", "Open the tab without focusing it"},
                    {"default", false}}}}},
                {"required", json::array({"action"})}};
}

json extraElementsSchema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"page",
           {{"type", "integer"},
            {"description", "Page number for pagination (default: 1, min: 1)"},
            {"minimum", 1},
            {"default", 1}}},
          {"pageSize",
           {{"type", "integer"},
            {"description", "Number of elements per page (default: 20, max: 100)"},
            {"minimum", 1},
            {"maximum", 100},
            {"default", 20}}},
          {"elementType",
           {{"type", "string"},
            {"description", "Filter by element type (default: all)"},
            {"enum", json::array({"button", "input", "link", "select", "textarea", "all"})},
            {"default", "all"}}},
          {"startIndex",
           {{"type", "integer"},
            {"description", "Start from a specific element (1-based, overrides page)"},
            {"minimum", 1}}}}},
        {"additionalProperties", false}};
}

} // namespace

// --- request DTOs ---

Result<NavigateRequest> NavigateRequest::fromJson(const json& j) {
    if (!j.is_object())
        return invalid("arguments must be an object");
    NavigateRequest req;
    auto it = j.find("url");
    if (it == j.end() || it->is_null())
        return invalid("url is required");
    if (!it->is_string())
        return invalid("url must be a string");
    req.url = it->get<std::string>();
    if (!boost::algorithm::istarts_with(req.url, "http://") &&
        !boost::algorithm::istarts_with(req.url, "https://"))
        return invalid("url must start with http:// or https://, got: " + req.url);

    auto timeout = parseTimeout(j, 1000, 120000);
    if (!timeout)
        return timeout.error();
    req.timeoutMs = timeout.value();
    return req;
}

json NavigateRequest::toJson() const {
    return json{{"url", url},
                {"timeout", timeoutMs ? json(*timeoutMs) : json("auto")}};
}

Result<ClickElementRequest> ClickElementRequest::fromJson(const json& j) {
    if (!j.is_object())
        return invalid("arguments must be an object");
    ClickElementRequest req;
    auto index = requireInt(j, "element_index");
    if (!index)
        return index.error();
    if (index.value() < 0)
        return invalid(fmt::format("element_index must be non-negative, got: {}", index.value()));
    req.elementIndex = index.value();

    if (auto it = j.find("wait_after"); it != j.end() && !it->is_null()) {
        if (!it->is_number())
            return invalid("wait_after must be a number");
        const int ms = numberToInt(*it).value_or(-1);
        if (ms < 0 || ms > 30000)
            return invalid("wait_after must be between 0 and 30000 milliseconds");
        req.waitAfterMs = ms;
    }

    auto domState = optionalBool(j, "return_dom_state", "return_dom_state");
    if (!domState)
        return domState.error();
    req.returnDomState = domState.value().value_or(false);
    return req;
}

json ClickElementRequest::toJson() const {
    return json{{"element_index", elementIndex}, {"wait_after", waitAfterMs}};
}

Result<TypeValueRequest> TypeValueRequest::fromJson(const json& j) {
    if (!j.is_object())
        return invalid("arguments must be an object");
    TypeValueRequest req;
    if (!j.contains("element_index"))
        return invalid("element_index is required");
    if (!j.contains("value"))
        return invalid("value is required");
    req.value = j.at("value");

    auto timeout = parseTimeout(j, 5000, 600000);
    if (!timeout)
        return timeout.error();
    req.timeoutMs = timeout.value();

    if (auto it = j.find("options"); it != j.end() && !it->is_null()) {
        if (!it->is_object())
            return invalid("options must be an object");
        for (const auto& [key, value] : it->items()) {
            if (key == "clear_first") {
                if (!value.is_boolean())
                    return invalid("options.clear_first must be a boolean");
                req.clearFirst = value.get<bool>();
            } else if (key == "submit") {
                if (!value.is_boolean())
                    return invalid("options.submit must be a boolean");
                req.submit = value.get<bool>();
            } else if (key == "wait_after") {
                if (!value.is_number())
                    return invalid("options.wait_after must be a number");
                const double seconds = value.get<double>();
                if (seconds < 0 || seconds > 30)
                    return invalid("options.wait_after must be between 0 and 30 seconds");
                req.waitAfterSeconds = seconds;
            } else {
                return invalid("unknown option: " + key);
            }
        }
    }

    auto index = requireInt(j, "element_index");
    if (!index)
        return index.error();
    if (index.value() < 0)
        return invalid(fmt::format("element_index must be non-negative, got: {}", index.value()));
    req.elementIndex = index.value();
    return req;
}

json TypeValueRequest::toJson() const {
    return json{{"element_index", elementIndex},
                {"value", value},
                {"options",
                 {{"clear_first", clearFirst}, {"submit", submit}, {"wait_after", waitAfterSeconds}}}};
}

Result<ScrollPageRequest> ScrollPageRequest::fromJson(const json& j) {
    if (!j.is_object())
        return invalid("arguments must be an object");
    ScrollPageRequest req;
    auto it = j.find("action");
    if (it == j.end() || it->is_null())
        return invalid("action is required");
    if (!it->is_string())
        return invalid("action must be a string");
    req.action = it->get<std::string>();
    static const std::array<const char*, 5> kActions = {"up", "down", "to_top", "to_bottom",
                                                        "to_element"};
    if (std::find(kActions.begin(), kActions.end(), req.action) == kActions.end())
        return invalid("invalid action: " + req.action +
                       ", must be one of: up, down, to_top, to_bottom, to_element");

    if (auto p = j.find("pixels"); p != j.end() && !p->is_null()) {
        if (!p->is_number())
            return invalid("pixels must be a number");
        auto pixels = numberToInt(*p);
        if (!pixels)
            return invalid(fmt::format("pixels is out of range, got: {}", p->dump()));
        if (*pixels <= 0)
            return invalid(fmt::format("pixels must be positive, got: {}", *pixels));
        req.pixels = *pixels;
    }

    if (auto e = j.find("element_index"); e != j.end() && !e->is_null()) {
        if (!e->is_number())
            return invalid("element_index must be a number");
        auto index = numberToInt(*e);
        if (!index)
            return invalid(fmt::format("element_index is out of range, got: {}", e->dump()));
        if (*index < 0)
            return invalid(fmt::format("element_index must be non-negative, got: {}", *index));
        req.elementIndex = *index;
    }
    if (req.action == "to_element" && !req.elementIndex)
        return invalid("element_index is required for to_element action");
    return req;
}

json ScrollPageRequest::toJson() const {
    json j{{"action", action}};
    if (action == "up" || action == "down")
        j["pixels"] = pixels;
    if (elementIndex)
        j["element_index"] = *elementIndex;
    return j;
}

Result<ManageTabsRequest> ManageTabsRequest::fromJson(const json& j) {
    if (!j.is_object())
        return invalid("arguments must be an object");
    ManageTabsRequest req;
    auto it = j.find("action");
    if (it == j.end() || it->is_null())
        return invalid("action is required");
    if (!it->is_string())
        return invalid("action must be a string");
    req.action = it->get<std::string>();
    if (req.action != "switch" && req.action != "open" && req.action != "close")
        return invalid("invalid action: " + req.action + ", must be one of: switch, open, close");

    if (auto t = j.find("tab_id"); t != j.end() && !t->is_null()) {
        if (t->is_string())
            req.tabId = t->get<std::string>();
        else if (t->is_number_integer())
            req.tabId = std::to_string(t->get<long long>());
        else
            return invalid("tab_id must be a string");
    }
    if (auto u = j.find("url"); u != j.end() && !u->is_null()) {
        if (!u->is_string())
            return invalid("url must be a string");
        req.url = u->get<std::string>();
    }
    auto background = optionalBool(j, "background", "background");
    if (!background)
        return background.error();
    req.background = background.value();

    if ((req.action == "switch" || req.action == "close") && (!req.tabId || req.tabId->empty()))
        return invalid("tab_id is required for " + req.action + " action");
    if (req.action == "open" && (!req.url || req.url->empty()))
        return invalid("url is required for open action");
    return req;
}

json ManageTabsRequest::toJson() const {
    json j{{"action", action}};
    if (tabId)
        j["tab_id"] = *tabId;
    if (url)
        j["url"] = *url;
    if (background)
        j["background"] = *background;
    return j;
}

// --- timeouts ---

bool containsSpecialKeyPattern(const json& value) {
    if (!value.is_string())
        return false;
    const auto& s = value.get_ref<const std::string&>();
    auto open = s.find('{');
    return open != std::string::npos && s.find('}', open + 1) != std::string::npos;
}

int computeTypeValueTimeout(const json& value, bool keyboardMode) {
    const int length = static_cast<int>(valueText(value).size());
    const int base = keyboardMode ? 20000 : 15000;
    if (length <= 100)
        return base;

    const int perSecond = keyboardMode ? 20 : 30;
    const int textFactor = ((length - 100) / perSecond) * 1000;

    int bonus = 0;
    if (length > 2000)
        bonus = 30000;
    else if (length > 1000)
        bonus = 20000;
    else if (length > 500)
        bonus = 10000;

    const int specialKeys = (keyboardMode || containsSpecialKeyPattern(value)) ? 5000 : 0;
    const int timeout = std::clamp(base + textFactor + bonus + specialKeys, 15000, 600000);
    spdlog::debug("type_value timeout: length={} keyboard={} -> {}ms", length, keyboardMode,
                  timeout);
    return timeout;
}

int computeTypeValueBuffer(int timeoutMs) {
    return std::clamp(timeoutMs / 4, 15000, 60000);
}

// --- BrowserCapabilities ---

BrowserCapabilities::BrowserCapabilities(CompanionCall call) : call_(std::move(call)) {}

BrowserCapabilities::BrowserCapabilities(std::shared_ptr<native::CorrelationManager> correlation)
    : call_([correlation = std::move(correlation)](const std::string& method, const json& params,
                                                   std::chrono::milliseconds timeout) {
          return correlation->call(method, params, timeout);
      }) {}

Result<void> BrowserCapabilities::registerWith(mcp::MCPServer& server) const {
    const BrowserCapabilities self = *this;

    std::vector<mcp::ToolDescriptor> tools;
    tools.push_back({"navigate_to",
                     "Navigate the active browser tab to a URL and wait for the page to load.",
                     navigateSchema(),
                     [self](const json& a) { return self.navigateTo(a); }});
    tools.push_back({"click_element",
                     "Click an interactive element by its index from the DOM state. Optionally "
                     "returns the refreshed DOM state when the page changes.",
                     clickSchema(), [self](const json& a) { return self.clickElement(a); }});
    tools.push_back({"type_value",
                     "Set values on form input elements and simulate keyboard input with special "
                     "keys and modifier combinations.",
                     typeValueSchema(), [self](const json& a) { return self.typeValue(a); }});
    tools.push_back({"scroll_page",
                     "Scroll the page up, down, to the top or bottom, or to a specific element.",
                     scrollSchema(), [self](const json& a) { return self.scrollPage(a); }});
    tools.push_back({"manage_tabs",
                     "Manage browser tabs: switch to, open, or close tabs.", manageTabsSchema(),
                     [self](const json& a) { return self.manageTabs(a); }});
    tools.push_back({"get_dom_extra_elements",
                     "Get interactive elements in the current viewport with pagination and "
                     "filtering by element type. Use when the DOM state overview shows more "
                     "elements than it lists.",
                     extraElementsSchema(),
                     [self](const json& a) { return self.getDomExtraElements(a); }});

    for (auto& tool : tools) {
        auto r = server.registerTool(std::move(tool));
        if (!r)
            return r;
    }

    auto r = server.registerResource(
        {uri::DOM_STATE, "DOM State",
         "Overview of the current page: metadata, the first interactive elements and the "
         "simplified DOM structure",
         "text/markdown", [self](const std::string& u) { return self.readDomState(u); }});
    if (!r)
        return r;

    return server.registerResource(
        {uri::CURRENT_STATE, "Current Browser State",
         "Active tab and open tabs as reported by the browser", "application/json",
         [self](const std::string& u) { return self.readCurrentState(u); }});
}

Result<json> BrowserCapabilities::navigateTo(const json& args) const {
    auto req = NavigateRequest::fromJson(args);
    if (!req)
        return req.error();
    const auto& r = req.value();

    const auto rpcTimeout = r.timeoutMs
                                ? std::chrono::milliseconds(*r.timeoutMs) + kNavigateBuffer
                                : kNavigateAutoTimeout;
    spdlog::info("Navigating to {} (rpc timeout {}ms)", r.url, rpcTimeout.count());

    const auto start = std::chrono::steady_clock::now();
    auto reply = call_("navigate_to", r.toJson(), rpcTimeout);
    if (!reply)
        return reply.error();
    auto outcome = checkCompanionOutcome(reply.value(), "Failed to navigate to " + r.url);
    if (!outcome)
        return outcome.error();

    const auto& data = reply.value();
    std::string text = "Navigation Result:\n- Status: Success\n";
    text += fmt::format("- URL: {}\n", replyString(data, "url", r.url));
    if (auto title = replyString(data, "title"); !title.empty())
        text += fmt::format("- Title: {}\n", title);
    text += fmt::format("- Message: {}\n",
                        replyString(data, "message", "Successfully navigated to " + r.url));
    text += fmt::format("- Execution Time: {:.2f} seconds", secondsSince(start));
    return json(text);
}

Result<json> BrowserCapabilities::clickElement(const json& args) const {
    auto req = ClickElementRequest::fromJson(args);
    if (!req)
        return req.error();
    const auto& r = req.value();

    auto reply = call_("click_element", r.toJson(),
                       kClickBaseTimeout + std::chrono::milliseconds(r.waitAfterMs));
    if (!reply)
        return reply.error();
    auto outcome = checkCompanionOutcome(
        reply.value(), fmt::format("Failed to click element at index {}", r.elementIndex));
    if (!outcome)
        return outcome.error();

    const auto& data = reply.value();
    const bool pageChanged = replyFlag(data, "page_changed") || replyFlag(data, "dom_changed");

    std::string text = "Click Element Result:\n- Status: Success\n";
    text += fmt::format("- Element Index: {}\n", r.elementIndex);
    text += fmt::format("- Page Changed: {}\n", pageChanged);
    text += fmt::format(
        "- Message: {}",
        replyString(data, "message",
                    fmt::format("Successfully clicked element at index {}", r.elementIndex)));

    if (r.returnDomState && pageChanged) {
        auto state = fetchDomState();
        if (state) {
            text += "\n\n--- DOM State ---\n";
            text += formatDomOverview(state.value());
        } else {
            spdlog::warn("click_element: DOM refresh failed: {}", state.error().message);
            text += "\n\n--- DOM State ---\nUnavailable: " + state.error().message;
        }
    }
    return json(text);
}

Result<json> BrowserCapabilities::typeValue(const json& args) const {
    auto req = TypeValueRequest::fromJson(args);
    if (!req)
        return req.error();
    const auto& r = req.value();

    const bool keyboardMode = containsSpecialKeyPattern(r.value);
    const int timeout = r.timeoutMs.value_or(computeTypeValueTimeout(r.value, keyboardMode));
    const int buffer = computeTypeValueBuffer(timeout);
    spdlog::info("type_value on element {} (length {}, keyboard {}, timeout {}ms + {}ms)",
                 r.elementIndex, valueText(r.value).size(), keyboardMode, timeout, buffer);

    const auto start = std::chrono::steady_clock::now();
    auto reply = call_("type_value", r.toJson(), std::chrono::milliseconds(timeout + buffer));
    if (!reply) {
        return Error{reply.error().code, "type_value RPC failed: " + reply.error().message};
    }

    const auto& data = reply.value();
    if (!replyFlag(data, "success")) {
        auto message = replyString(
            data, "message",
            fmt::format("Failed to type value on element at index {}", r.elementIndex));
        auto code = replyString(data, "error_code", "TYPE_VALUE_FAILED");
        spdlog::warn("type_value failed on element {}: {} ({})", r.elementIndex, message, code);
        return Error{ErrorCode::RemoteError, fmt::format("{} ({})", message, code)};
    }

    const auto inputMethod = replyString(data, "input_method");
    const bool domChanged = replyFlag(data, "dom_changed");

    std::string text = "Type Value Result:\n- Status: Success\n";
    text += fmt::format(
        "- Message: {}\n",
        replyString(data, "message",
                    fmt::format("Successfully typed value on element at index {}", r.elementIndex)));
    text += fmt::format("- Element Index: {}\n", r.elementIndex);
    text += fmt::format("- Input Mode: {}\n", (keyboardMode || inputMethod == "keyboard")
                                                  ? "keyboard input"
                                                  : "standard form input");
    text += fmt::format("- Element Type: {}\n", replyString(data, "element_type"));
    text += fmt::format("- Execution Time: {:.2f} seconds", secondsSince(start));

    if (domChanged) {
        text += "\n- DOM Changed: Yes (interactive elements modified)";
        text += "\n\nIMPORTANT: DOM has been modified by this operation.";
        text += "\n   Read the browser://dom/state resource to get the updated DOM state";
        text += "\n   before performing any subsequent element interactions.";
    } else {
        text += "\n- DOM Changed: No";
    }

    if (auto info = data.find("element_info"); info != data.end() && info->is_object()) {
        if (auto t = replyString(*info, "text"); !t.empty())
            text += "\n- Element Text: " + t;
        if (auto tag = info->find("tag_name"); tag != info->end() && !tag->is_null())
            text += "\n- Element Tag: " + valueText(*tag);
        if (auto p = replyString(*info, "placeholder"); !p.empty())
            text += "\n- Placeholder: " + p;
    }

    if (auto ops = data.find("operations_performed");
        ops != data.end() && ops->is_array() && !ops->empty()) {
        text += "\n\nKeyboard Operations Performed:";
        int n = 0;
        for (const auto& op : *ops) {
            ++n;
            if (!op.is_object())
                continue;
            const auto type = replyString(op, "type");
            if (type == "text") {
                text += fmt::format("\n{}. Typed text: \"{}\"", n, replyString(op, "content"));
            } else if (type == "specialKey") {
                text += fmt::format("\n{}. Pressed special key: {}", n, replyString(op, "key"));
            } else if (type == "modifierCombination") {
                std::vector<std::string> mods;
                if (auto m = op.find("modifiers"); m != op.end() && m->is_array()) {
                    for (const auto& mod : *m)
                        mods.push_back(valueText(mod));
                }
                text += fmt::format("\n{}. Key combination: {}+{}", n, fmt::join(mods, "+"),
                                    replyString(op, "key"));
            }
        }
    }
    return json(text);
}

Result<json> BrowserCapabilities::scrollPage(const json& args) const {
    auto req = ScrollPageRequest::fromJson(args);
    if (!req)
        return req.error();
    const auto& r = req.value();

    auto reply = call_("scroll_page", r.toJson(), kScrollTimeout);
    if (!reply)
        return reply.error();
    auto outcome = checkCompanionOutcome(reply.value(), "Failed to scroll page");
    if (!outcome)
        return outcome.error();

    const auto& data = reply.value();
    std::string text = "Scroll Page Result:\n- Status: Success\n";
    text += fmt::format("- Action: {}\n", r.action);
    if (r.action == "up" || r.action == "down")
        text += fmt::format("- Pixels: {}\n", r.pixels);
    if (r.elementIndex)
        text += fmt::format("- Element Index: {}\n", *r.elementIndex);
    text += fmt::format("- Message: {}", replyString(data, "message", "Scrolled " + r.action));
    return json(text);
}

Result<json> BrowserCapabilities::manageTabs(const json& args) const {
    auto req = ManageTabsRequest::fromJson(args);
    if (!req)
        return req.error();
    const auto& r = req.value();

    auto reply = call_("manage_tabs", r.toJson(), kTabsTimeout);
    if (!reply)
        return reply.error();
    auto outcome = checkCompanionOutcome(reply.value(), "Failed to " + r.action + " tab");
    if (!outcome)
        return outcome.error();

    const auto& data = reply.value();
    std::string text = "Manage Tabs Result:\n- Status: Success\n";
    text += fmt::format("- Action: {}\n", r.action);
    if (r.tabId) {
        text += fmt::format("- Tab ID: {}\n", *r.tabId);
    } else if (data.is_object() && data.contains("tab_id") && !data["tab_id"].is_null()) {
        text += fmt::format("- Tab ID: {}\n", valueText(data["tab_id"]));
    }
    if (r.url)
        text += fmt::format("- URL: {}\n", *r.url);
    text += fmt::format("- Message: {}", replyString(data, "message", "Tab " + r.action + " completed"));
    return json(text);
}

Result<json> BrowserCapabilities::getDomExtraElements(const json& args) const {
    auto req = ExtraElementsRequest::fromJson(args);
    if (!req)
        return Error{ErrorCode::InvalidArgument, "invalid arguments: " + req.error().message};

    auto state = fetchDomState();
    if (!state)
        return state.error();

    auto page = paginateElements(state.value().interactiveElements, req.value());
    spdlog::debug("get_dom_extra_elements: {} total, page {}/{}", page.totalElements,
                  page.currentPage, page.totalPages);
    return json(formatElementPage(page));
}

Result<std::string> BrowserCapabilities::readDomState(const std::string&) const {
    auto state = fetchDomState();
    if (!state)
        return state.error();
    return formatDomOverview(state.value());
}

Result<std::string> BrowserCapabilities::readCurrentState(const std::string&) const {
    auto reply = call_("get_current_state", json::object(), kCurrentStateTimeout);
    if (!reply)
        return Error{reply.error().code, "failed to request current state: " + reply.error().message};
    return reply.value().dump(2, ' ', false, json::error_handler_t::replace);
}

Result<DomState> BrowserCapabilities::fetchDomState() const {
    auto reply = call_("get_dom_state", json::object(), kDomStateTimeout);
    if (!reply) {
        spdlog::error("Error requesting DOM state: {}", reply.error().message);
        return Error{reply.error().code, "failed to request DOM state: " + reply.error().message};
    }
    return DomState::fromJson(reply.value());
}

} // namespace nmbridge::browser
