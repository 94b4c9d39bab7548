#pragma once

#include "Registry.hpp"

namespace mini_mcp {

/**
 * @brief Runs registered tools by name
 *
 * Exceptions thrown by a tool are reported as ToolError so a failing tool
 * never turns into a protocol error.
 */
class ToolExecutor {
public:
    explicit ToolExecutor(const Registry& registry);

    /**
     * @brief Execute a tool
     * @param name Registered tool name
     * @param args Arguments passed through unexamined
     * @throws std::out_of_range if no tool with this name is registered
     */
    ToolOutcome execute(const std::string& name, const json& args) const;

private:
    const Registry& registry_;
};

/**
 * @brief Embed a tool outcome into a tools/call result payload
 */
json to_result(const ToolOutcome& outcome);

} // namespace mini_mcp
