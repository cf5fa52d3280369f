#pragma once

#include <nmbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace nmbridge::browser {

using json = nlohmann::json;

// JSON number truncated to int; nullopt for non-numbers, NaN, infinities and values outside int
std::optional<int> numberToInt(const json& v);

// Number of interactive elements rendered by the DOM overview resource
constexpr size_t kDomOverviewLimit = 20;

// Raw DOM snapshot as returned by the companion's get_dom_state call
struct DomState {
    std::string formattedDom;
    json interactiveElements = json::array();
    json meta; // null when the companion sent none

    static Result<DomState> fromJson(const json& j);
    json toJson() const;
};

// Markdown overview: metadata, the first `limit` elements, a hint when more exist, DOM structure
std::string formatDomOverview(const DomState& state, size_t limit = kDomOverviewLimit);

struct ExtraElementsRequest {
    using RequestType = ExtraElementsRequest;

    int page = 1;
    int pageSize = 20;
    std::string elementType = "all";
    std::optional<int> startIndex; // 1-based; overrides page

    static Result<ExtraElementsRequest> fromJson(const json& j);
    json toJson() const;
};

struct ElementPage {
    json elements = json::array();
    int currentPage = 1;
    int pageSize = 20;
    int totalElements = 0;
    int totalPages = 0;
    bool hasNextPage = false;
    bool hasPreviousPage = false;
    int startIndex = 1; // 1-based
    int endIndex = 0;   // 1-based, inclusive
    std::optional<std::string> filter;
};

// Filter by element type, then cut one page. Out-of-range pages clamp to the last page.
ElementPage paginateElements(const json& interactiveElements, const ExtraElementsRequest& req);

std::string formatElementPage(const ElementPage& page);

// Short hint telling an agent what an element is for
std::string describeElementAction(const std::string& tagName, const std::string& attributes);

} // namespace nmbridge::browser
