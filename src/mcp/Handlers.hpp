#pragma once

#include "Message.hpp"
#include "Registry.hpp"
#include "ResourceReader.hpp"
#include "ToolExecutor.hpp"
#include <stdexcept>
#include <string>

namespace mini_mcp {

/// MCP protocol revision advertised by initialize
inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

/// Mime type reported for every resources/read content item
inline constexpr const char* kResourceMimeType = "text/plain";

/**
 * @brief Server identity reported by initialize
 */
struct ServerInfo {
    std::string name;
    std::string version;
};

/**
 * @brief Everything a method handler may read
 */
struct HandlerContext {
    const ServerInfo& server_info;
    const Registry& registry;
    const ToolExecutor& executor;
    const ResourceReader& reader;
};

/**
 * @brief Raised when params do not match the method's expected shape
 *
 * what() is the message reported with code -32602.
 */
class InvalidParams : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Decoded tools/call params
struct ToolCallParams {
    std::string name;
    json arguments;
};

/// Decoded resources/read params
struct ResourceReadParams {
    std::string uri;
};

/**
 * @brief Validate tools/call params
 * @throws InvalidParams if params is not an object or name is not a string
 */
ToolCallParams decode_tool_call_params(const json& params);

/**
 * @brief Validate resources/read params
 * @throws InvalidParams if params is not an object or uri is not a string
 */
ResourceReadParams decode_resource_read_params(const json& params);

Response handle_initialize(const Request& request, const HandlerContext& context);
Response handle_tools_list(const Request& request, const HandlerContext& context);

/**
 * @brief Handle tools/call
 *
 * Unknown tools produce -32601. Tool failures are embedded in the result
 * as {"error": ...}, never reported as JSON-RPC errors.
 */
Response handle_tools_call(const Request& request, const HandlerContext& context);

Response handle_resources_list(const Request& request, const HandlerContext& context);

/**
 * @brief Handle resources/read
 *
 * URIs outside the scheme allow-list produce -32602 "Invalid URI scheme";
 * reader failures produce -32002.
 */
Response handle_resources_read(const Request& request, const HandlerContext& context);

} // namespace mini_mcp
