#include <nmbridge/mcp/capability_registry.h>

#include <spdlog/spdlog.h>

#include <mutex>

namespace nmbridge::mcp {

json wrapToolResult(const json& structured) {
    if (structured.is_object() && structured.contains("content")) {
        return structured;
    }
    const std::string text = structured.is_string() ? structured.get<std::string>()
                                                    : structured.dump();
    return json{{"content", json::array({json{{"type", "text"}, {"text", text}}})}};
}

json toolErrorResult(const std::string& message) {
    return json{{"content", json::array({json{{"type", "text"}, {"text", message}}})},
                {"isError", true}};
}

Result<void> CapabilityRegistry::registerTool(ToolDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Tool name must not be empty"};
    }
    if (!descriptor.handler) {
        return Error{ErrorCode::InvalidArgument, "Tool '" + descriptor.name + "' has no handler"};
    }

    std::unique_lock lock(mutex_);
    const std::string name = descriptor.name;
    auto [it, inserted] = tools_.emplace(name, std::move(descriptor));
    if (!inserted) {
        return Error{ErrorCode::AlreadyExists, "Duplicate tool registration: " + name};
    }
    toolOrder_.push_back(name);
    spdlog::debug("Registered tool: {}", name);
    return Result<void>();
}

Result<void> CapabilityRegistry::registerResource(ResourceDescriptor descriptor) {
    if (descriptor.uri.empty()) {
        return Error{ErrorCode::InvalidArgument, "Resource URI must not be empty"};
    }
    if (!descriptor.reader) {
        return Error{ErrorCode::InvalidArgument,
                     "Resource '" + descriptor.uri + "' has no reader"};
    }

    std::unique_lock lock(mutex_);
    const std::string uri = descriptor.uri;
    auto [it, inserted] = resources_.emplace(uri, std::move(descriptor));
    if (!inserted) {
        return Error{ErrorCode::AlreadyExists, "Duplicate resource registration: " + uri};
    }
    resourceOrder_.push_back(uri);
    spdlog::debug("Registered resource: {}", uri);
    return Result<void>();
}

json CapabilityRegistry::listTools() const {
    std::shared_lock lock(mutex_);
    json tools = json::array();
    for (const auto& name : toolOrder_) {
        const auto& desc = tools_.at(name);
        tools.push_back(json{{"name", desc.name},
                             {"description", desc.description},
                             {"inputSchema", desc.inputSchema}});
    }
    return json{{"tools", std::move(tools)}};
}

json CapabilityRegistry::listResources() const {
    std::shared_lock lock(mutex_);
    json resources = json::array();
    for (const auto& uri : resourceOrder_) {
        const auto& desc = resources_.at(uri);
        resources.push_back(json{{"uri", desc.uri},
                                 {"name", desc.name},
                                 {"description", desc.description},
                                 {"mimeType", desc.mimeType}});
    }
    return json{{"resources", std::move(resources)}};
}

json CapabilityRegistry::callTool(const std::string& name, const json& arguments) const {
    ToolDescriptor::Handler handler;
    {
        std::shared_lock lock(mutex_);
        if (auto it = tools_.find(name); it != tools_.end()) {
            handler = it->second.handler;
        }
    }
    if (!handler) {
        return toolErrorResult("Unknown tool: " + name);
    }

    try {
        auto result = handler(arguments.is_null() ? json::object() : arguments);
        if (!result) {
            spdlog::debug("Tool '{}' failed: {}", name, result.error().message);
            return toolErrorResult(result.error().message);
        }
        return wrapToolResult(result.value());
    } catch (const std::exception& e) {
        spdlog::error("Tool '{}' threw: {}", name, e.what());
        return toolErrorResult(std::string("Tool execution failed: ") + e.what());
    }
}

Result<json> CapabilityRegistry::readResource(const std::string& uri) const {
    ResourceDescriptor::Reader reader;
    std::string mimeType;
    {
        std::shared_lock lock(mutex_);
        auto it = resources_.find(uri);
        if (it == resources_.end()) {
            return Error{ErrorCode::NotFound, "Unknown resource: " + uri};
        }
        reader = it->second.reader;
        mimeType = it->second.mimeType;
    }

    try {
        auto text = reader(uri);
        if (!text) {
            return text.error();
        }
        return json{{"contents", json::array({json{
                                     {"uri", uri}, {"mimeType", mimeType}, {"text", text.value()}}})}};
    } catch (const std::exception& e) {
        spdlog::error("Resource reader for '{}' threw: {}", uri, e.what());
        return Error{ErrorCode::InternalError, std::string("Resource read failed: ") + e.what()};
    }
}

bool CapabilityRegistry::hasTool(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return tools_.count(name) != 0;
}

bool CapabilityRegistry::hasResource(const std::string& uri) const {
    std::shared_lock lock(mutex_);
    return resources_.count(uri) != 0;
}

size_t CapabilityRegistry::toolCount() const {
    std::shared_lock lock(mutex_);
    return tools_.size();
}

size_t CapabilityRegistry::resourceCount() const {
    std::shared_lock lock(mutex_);
    return resources_.size();
}

} // namespace nmbridge::mcp
