#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace mini_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Metadata for an MCP resource
 */
struct ResourceInfo {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

/**
 * @brief Application-level tool failure
 *
 * Reported inside a successful response as {"error": message}.
 */
struct ToolError {
    std::string message;
};

/// Either the tool's success payload or an application-level failure
using ToolOutcome = std::variant<json, ToolError>;

/**
 * @brief Function signature for tool execution
 * @param args Tool arguments exactly as sent by the client
 * @return Success payload or ToolError
 */
using ToolHandler = std::function<ToolOutcome(const json& args)>;

/**
 * @brief Registered tools and resources of one server instance
 *
 * Tools are keyed by name, resources by URI; both are kept sorted so
 * listings are stable. Registration is only allowed until seal() is called,
 * after which the registry is read-only.
 */
class Registry {
public:
    struct ToolEntry {
        ToolInfo info;
        ToolHandler handler;
    };

    /**
     * @brief Register a tool with handler
     * @throws std::invalid_argument on empty name, null handler or duplicate name
     * @throws std::logic_error if the registry is sealed
     */
    void register_tool(ToolInfo info, ToolHandler handler);

    /**
     * @brief Register a resource
     * @throws std::invalid_argument on empty URI or duplicate URI
     * @throws std::logic_error if the registry is sealed
     */
    void register_resource(ResourceInfo info);

    /**
     * @brief Find a tool by name
     * @return Entry or nullptr if no such tool
     */
    const ToolEntry* find_tool(const std::string& name) const;

    const ResourceInfo* find_resource(const std::string& uri) const;

    /// Tools ordered by name
    std::vector<ToolInfo> tools() const;

    /// Resources ordered by URI
    std::vector<ResourceInfo> resources() const;

    size_t tool_count() const { return tools_.size(); }
    size_t resource_count() const { return resources_.size(); }

    /// Forbid further registration
    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

private:
    void ensure_mutable() const;

    std::map<std::string, ToolEntry> tools_;
    std::map<std::string, ResourceInfo> resources_;
    bool sealed_ = false;
};

json to_json(const ToolInfo& info);
json to_json(const ResourceInfo& info);

} // namespace mini_mcp
