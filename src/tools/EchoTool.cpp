#include "EchoTool.hpp"
#include <spdlog/spdlog.h>

namespace mini_mcp {

ToolInfo EchoTool::get_info() {
    return {
        "echo",
        "Echo the given message back",
        {
            {"type", "object"},
            {"properties", {
                {"message", {
                    {"type", "string"},
                    {"description", "Text to echo"}
                }}
            }},
            {"required", json::array({"message"})}
        }
    };
}

ToolOutcome EchoTool::execute(const json& args) const {
    if (!args.is_object()) {
        return ToolError{"Invalid arguments"};
    }

    auto message_it = args.find("message");
    if (message_it == args.end() || !message_it->is_string()) {
        return ToolError{"Message is required"};
    }

    const auto& message = message_it->get_ref<const std::string&>();
    spdlog::debug("EchoTool: echoing {} bytes", message.size());

    return json{
        {"content", json::array({
            {
                {"type", "text"},
                {"text", "Echo: " + message}
            }
        })}
    };
}

} // namespace mini_mcp
