#include <nmbridge/browser/dom_state.h>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace nmbridge::browser {

namespace {

std::string plainValue(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    return v.dump();
}

std::string trimmedString(const json& element, const char* key) {
    auto it = element.find(key);
    if (it == element.end() || !it->is_string())
        return {};
    return boost::algorithm::trim_copy(it->get<std::string>());
}

std::string titleCase(std::string key) {
    if (!key.empty())
        key[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(key[0])));
    return key;
}

std::string elementTagName(const json& element) {
    auto it = element.find("tagName");
    if (it != element.end() && it->is_string())
        return it->get<std::string>();
    return "unknown";
}

int elementIndex(const json& element) {
    auto it = element.find("index");
    if (it != element.end())
        return numberToInt(*it).value_or(0);
    return 0;
}

std::string elementAttributes(const json& element) {
    auto it = element.find("attributes");
    if (it == element.end() || !it->is_object())
        return {};
    std::vector<std::string> parts;
    for (const auto& [key, value] : it->items()) {
        if (value.is_string() && !value.get<std::string>().empty())
            parts.push_back(fmt::format("{}=\"{}\"", key, value.get<std::string>()));
    }
    return boost::algorithm::join(parts, " ");
}

// tagName "a" is filtered as "link"
std::string filterTypeOf(const std::string& tagName) {
    return tagName == "a" ? "link" : tagName;
}

Result<int> integerArgument(const json& args, const char* key) {
    const auto& v = args.at(key);
    if (!v.is_number()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{} must be an integer, got {}", key, v.type_name())};
    }
    auto n = numberToInt(v);
    if (!n) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{} is out of range, got {}", key, v.dump())};
    }
    return *n;
}

void appendElementProperties(std::string& out, const json& element) {
    // Known keys first in a stable order, then anything else the companion sent
    static const std::array<std::pair<const char*, const char*>, 8> kKnown = {{
        {"type", "Type"},
        {"text", "Text"},
        {"id", "ID"},
        {"class", "Class"},
        {"href", "URL"},
        {"value", "Value"},
        {"placeholder", "Placeholder"},
        {"xpath", "XPath"},
    }};
    for (const auto& [key, label] : kKnown) {
        auto it = element.find(key);
        if (it == element.end() || it->is_null())
            continue;
        if (std::string_view(key) == "type") {
            out += fmt::format("- **Type:** {}\n", plainValue(*it));
            continue;
        }
        if (!it->is_string())
            continue;
        const auto text = it->get<std::string>();
        if (boost::algorithm::trim_copy(text).empty())
            continue;
        if (std::string_view(key) == "xpath")
            out += fmt::format("- **XPath:** `{}`\n", text);
        else
            out += fmt::format("- **{}:** {}\n", label, text);
    }

    for (auto it = element.begin(); it != element.end(); ++it) {
        const std::string key = it.key();
        const json& value = it.value();
        if (value.is_null() || key == "index" || key == "selector")
            continue;
        const bool known = std::any_of(kKnown.begin(), kKnown.end(),
                                       [&](const auto& k) { return key == k.first; });
        if (known)
            continue;
        if (value.is_string()) {
            if (!boost::algorithm::trim_copy(value.get<std::string>()).empty())
                out += fmt::format("- **{}:** {}\n", titleCase(key), value.get<std::string>());
        } else {
            out += fmt::format("- **{}:** {}\n", titleCase(key), value.dump());
        }
    }
}

} // namespace

std::optional<int> numberToInt(const json& v) {
    if (v.is_number_integer()) {
        if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                return std::nullopt;
            return static_cast<int>(u);
        }
        const auto i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(i);
    }
    if (!v.is_number_float())
        return std::nullopt;
    const double d = std::trunc(v.get<double>());
    if (!std::isfinite(d) || d < static_cast<double>(std::numeric_limits<int>::min()) ||
        d > static_cast<double>(std::numeric_limits<int>::max()))
        return std::nullopt;
    return static_cast<int>(d);
}

Result<DomState> DomState::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "failed to parse DOM state data: expected an object"};
    }
    DomState state;
    if (auto it = j.find("formattedDom"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Error{ErrorCode::InvalidData,
                         "failed to parse DOM state data: formattedDom must be a string"};
        }
        state.formattedDom = it->get<std::string>();
    }
    if (auto it = j.find("interactiveElements"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Error{ErrorCode::InvalidData,
                         "failed to parse DOM state data: interactiveElements must be an array"};
        }
        for (const auto& e : *it) {
            if (!e.is_object()) {
                return Error{ErrorCode::InvalidData,
                             "failed to parse DOM state data: element must be an object"};
            }
        }
        state.interactiveElements = *it;
    }
    if (auto it = j.find("meta"); it != j.end())
        state.meta = *it;
    return state;
}

json DomState::toJson() const {
    json j{{"formattedDom", formattedDom}, {"interactiveElements", interactiveElements}};
    if (!meta.is_null())
        j["meta"] = meta;
    return j;
}

std::string formatDomOverview(const DomState& state, size_t limit) {
    const size_t total = state.interactiveElements.size();
    const size_t shown = std::min(total, limit);
    const bool hasMore = total > limit;

    std::string out = "# DOM State Overview\n\n";

    if (!state.meta.is_null()) {
        out += "## Page Metadata\n";
        if (state.meta.is_object()) {
            for (const auto& [key, value] : state.meta.items())
                out += fmt::format("- **{}:** {}\n", key, plainValue(value));
        } else {
            out += fmt::format("- {}\n", plainValue(state.meta));
        }
        out += "\n";
    }

    out += "## Interactive Elements Summary\n";
    out += fmt::format("- **Total Elements:** {}\n", total);
    out += fmt::format("- **Showing:** First {} elements\n", shown);
    if (hasMore) {
        out += fmt::format("- **Additional Elements:** {} more elements available\n", total - shown);
        out += "- **Access More:** Use the `get_dom_extra_elements` tool for pagination and "
               "filtering\n";
    } else {
        out += "- **Status:** All interactive elements shown\n";
    }
    out += "\n";

    if (shown == 0) {
        out += "## Interactive Elements\n\n";
        out += "*No interactive elements found on this page.*\n\n";
    } else {
        out += "## Interactive Elements (Overview)\n\n";
        for (size_t i = 0; i < shown; ++i) {
            const auto& element = state.interactiveElements[i];
            auto idx = element.find("index");
            out += fmt::format("### Element [{}]\n",
                               idx != element.end() ? plainValue(*idx) : std::string("?"));
            appendElementProperties(out, element);
            out += "\n";
        }
    }

    if (hasMore) {
        out += "---\n\n";
        out += "**Need More Elements?**\n\n";
        out += fmt::format("This overview shows the first {} interactive elements. ", limit);
        out += fmt::format("There are {} more elements available on this page.\n\n", total - shown);
        out += "Use the `get_dom_extra_elements` tool to:\n";
        out += fmt::format("- Access elements beyond the first {}\n", limit);
        out += "- Filter by element type (button, input, link, etc.)\n";
        out += "- Navigate through pages of elements\n";
        out += "- Get specific ranges of elements\n\n";
    }

    if (!boost::algorithm::trim_copy(state.formattedDom).empty()) {
        out += "## DOM Structure\n\n```html\n";
        out += state.formattedDom;
        out += "\n```\n";
    }
    return out;
}

Result<ExtraElementsRequest> ExtraElementsRequest::fromJson(const json& j) {
    ExtraElementsRequest req;
    if (j.is_null())
        return req;
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "invalid arguments: expected an object"};

    auto present = [&](const char* key) { return j.contains(key) && !j.at(key).is_null(); };

    if (present("page")) {
        auto page = integerArgument(j, "page");
        if (!page)
            return page.error();
        if (page.value() < 1)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("page must be >= 1, got {}", page.value())};
        req.page = page.value();
    }
    if (present("pageSize")) {
        auto size = integerArgument(j, "pageSize");
        if (!size)
            return size.error();
        if (size.value() < 1 || size.value() > 100)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("pageSize must be between 1 and 100, got {}", size.value())};
        req.pageSize = size.value();
    }
    if (present("elementType")) {
        const auto& v = j.at("elementType");
        if (!v.is_string())
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("elementType must be a string, got {}", v.type_name())};
        static const std::array<const char*, 6> kTypes = {"button", "input",    "link",
                                                          "select", "textarea", "all"};
        const auto type = v.get<std::string>();
        if (std::find(kTypes.begin(), kTypes.end(), type) == kTypes.end())
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("invalid elementType: {}, must be one of: button, input, "
                                     "link, select, textarea, all",
                                     type)};
        req.elementType = type;
    }
    if (present("startIndex")) {
        auto start = integerArgument(j, "startIndex");
        if (!start)
            return start.error();
        if (start.value() < 1)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("startIndex must be >= 1, got {}", start.value())};
        req.startIndex = start.value();
    }
    return req;
}

json ExtraElementsRequest::toJson() const {
    json j{{"page", page}, {"pageSize", pageSize}, {"elementType", elementType}};
    if (startIndex)
        j["startIndex"] = *startIndex;
    return j;
}

ElementPage paginateElements(const json& interactiveElements, const ExtraElementsRequest& req) {
    ElementPage result;
    result.pageSize = req.pageSize;

    json elements = json::array();
    if (interactiveElements.is_array()) {
        if (req.elementType == "all") {
            elements = interactiveElements;
        } else {
            for (const auto& e : interactiveElements) {
                auto tag = e.find("tagName");
                if (tag != e.end() && tag->is_string() &&
                    filterTypeOf(tag->get<std::string>()) == req.elementType)
                    elements.push_back(e);
            }
            result.filter = req.elementType;
        }
    }

    const int total = static_cast<int>(elements.size());
    int page = req.page;
    if (req.startIndex)
        page = (*req.startIndex - 1) / req.pageSize + 1;

    const int totalPages = (total + req.pageSize - 1) / req.pageSize;
    if (totalPages > 0 && page > totalPages)
        page = totalPages;

    int begin = std::min((page - 1) * req.pageSize, total);
    int end = std::min(begin + req.pageSize, total);
    for (int i = begin; i < end; ++i)
        result.elements.push_back(elements[static_cast<size_t>(i)]);

    result.currentPage = page;
    result.totalElements = total;
    result.totalPages = totalPages;
    result.hasNextPage = page < totalPages;
    result.hasPreviousPage = page > 1;
    result.startIndex = begin + 1;
    result.endIndex = end;
    return result;
}

std::string describeElementAction(const std::string& tagName, const std::string& attributes) {
    auto has = [&](std::string_view needle) {
        return attributes.find(needle) != std::string::npos;
    };
    if (tagName == "button")
        return has("type=\"submit\"") ? "Click to submit form" : "Click to perform action";
    if (tagName == "input") {
        if (has("type=\"email\""))
            return "Enter email address";
        if (has("type=\"password\""))
            return "Enter password";
        if (has("type=\"text\""))
            return "Enter text input";
        return "Enter input value";
    }
    if (tagName == "a")
        return has("href=") ? "Click to navigate to link" : "Click to activate link";
    if (tagName == "select")
        return "Click to open dropdown and select option";
    if (tagName == "textarea")
        return "Click to enter multi-line text";
    return "Click to interact with element";
}

std::string formatElementPage(const ElementPage& page) {
    std::string out =
        fmt::format("# DOM Elements - Page {} of {}\n\n", page.currentPage, page.totalPages);
    out += fmt::format("**Total Found**: {} elements | **Showing**: Elements {}-{} | **Filter**: {}\n\n",
                       page.totalElements, page.startIndex, page.endIndex,
                       page.filter.value_or("all types"));
    out += "---\n\n";

    if (page.elements.empty()) {
        out += "## No Elements Found\n\n";
        out += "No interactive elements match the current filter criteria.\n\n";
    } else {
        out += "## Elements\n\n";
        const size_t n = page.elements.size();
        for (size_t i = 0; i < n; ++i) {
            const auto& element = page.elements[i];
            const auto tag = elementTagName(element);
            const auto text = trimmedString(element, "text");
            const auto attributes = elementAttributes(element);

            out += fmt::format("### Element [{}]\n", elementIndex(element));
            out += fmt::format("**Type**: {}", tag);
            if (!text.empty())
                out += fmt::format(" | **Text**: \"{}\"", text);
            out += "  \n";
            if (!attributes.empty())
                out += fmt::format("**Attributes**: `{}`  \n", attributes);
            out += fmt::format("**Action**: {}\n", describeElementAction(tag, attributes));
            if (i + 1 < n)
                out += "\n";
        }
    }

    std::vector<std::string> nav;
    nav.push_back(page.hasPreviousPage ? fmt::format("Previous: page={}", page.currentPage - 1)
                                       : std::string("Previous: N/A"));
    nav.push_back(page.hasNextPage ? fmt::format("Next: page={}", page.currentPage + 1)
                                   : std::string("Next: N/A"));
    if (page.totalPages > 1) {
        std::vector<std::string> pages;
        for (int p = 1; p <= page.totalPages; ++p)
            pages.push_back(std::to_string(p));
        nav.push_back("Pages: " + boost::algorithm::join(pages, ", "));
    }
    out += "\n---\n\n";
    out += fmt::format("**Navigation**: {}\n", boost::algorithm::join(nav, " | "));
    return out;
}

} // namespace nmbridge::browser
