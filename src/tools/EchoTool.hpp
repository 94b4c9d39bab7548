#pragma once

#include "mcp/Registry.hpp"

namespace mini_mcp {

/**
 * @brief MCP tool that echoes a message back to the client
 *
 * Returns a single text content item "Echo: <message>".
 */
class EchoTool {
public:
    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "message" parameter
     * @return Text content, or ToolError if message is missing
     */
    ToolOutcome execute(const json& args) const;
};

} // namespace mini_mcp
