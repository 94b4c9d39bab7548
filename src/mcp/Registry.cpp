#include "Registry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mini_mcp {

void Registry::ensure_mutable() const {
    if (sealed_) {
        throw std::logic_error("Registry is read-only once the server is running");
    }
}

void Registry::register_tool(ToolInfo info, ToolHandler handler) {
    ensure_mutable();
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (tools_.count(info.name) != 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    std::string name = info.name;
    tools_.emplace(name, ToolEntry{std::move(info), std::move(handler)});
    spdlog::info("Registered tool: {}", name);
}

void Registry::register_resource(ResourceInfo info) {
    ensure_mutable();
    if (info.uri.empty()) {
        throw std::invalid_argument("Resource URI cannot be empty");
    }
    if (resources_.count(info.uri) != 0) {
        throw std::invalid_argument("Resource already registered: " + info.uri);
    }

    std::string uri = info.uri;
    resources_.emplace(uri, std::move(info));
    spdlog::info("Registered resource: {}", uri);
}

const Registry::ToolEntry* Registry::find_tool(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

const ResourceInfo* Registry::find_resource(const std::string& uri) const {
    auto it = resources_.find(uri);
    return it == resources_.end() ? nullptr : &it->second;
}

std::vector<ToolInfo> Registry::tools() const {
    std::vector<ToolInfo> result;
    result.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        result.push_back(entry.info);
    }
    return result;
}

std::vector<ResourceInfo> Registry::resources() const {
    std::vector<ResourceInfo> result;
    result.reserve(resources_.size());
    for (const auto& [uri, info] : resources_) {
        result.push_back(info);
    }
    return result;
}

json to_json(const ToolInfo& info) {
    return {
        {"name", info.name},
        {"description", info.description},
        {"inputSchema", info.input_schema}
    };
}

json to_json(const ResourceInfo& info) {
    return {
        {"uri", info.uri},
        {"name", info.name},
        {"description", info.description},
        {"mimeType", info.mime_type}
    };
}

} // namespace mini_mcp
