#include "ToolExecutor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mini_mcp {

ToolExecutor::ToolExecutor(const Registry& registry)
    : registry_(registry) {
}

ToolOutcome ToolExecutor::execute(const std::string& name, const json& args) const {
    const Registry::ToolEntry* entry = registry_.find_tool(name);
    if (!entry) {
        throw std::out_of_range("Unknown tool: " + name);
    }

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("Calling tool: {} with args: {}", name,
                      args.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    try {
        ToolOutcome outcome = entry->handler(args);
        if (auto* error = std::get_if<ToolError>(&outcome)) {
            spdlog::debug("Tool {} reported error: {}", name, error->message);
        }
        return outcome;
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", name, e.what());
        return ToolError{e.what()};
    }
}

json to_result(const ToolOutcome& outcome) {
    if (const auto* error = std::get_if<ToolError>(&outcome)) {
        return {{"error", error->message}};
    }
    return std::get<json>(outcome);
}

} // namespace mini_mcp
