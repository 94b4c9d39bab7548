#include "Handlers.hpp"
#include <spdlog/spdlog.h>

namespace mini_mcp {

ToolCallParams decode_tool_call_params(const json& params) {
    if (!params.is_object()) {
        throw InvalidParams("Invalid parameters");
    }
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw InvalidParams("Invalid parameters");
    }

    ToolCallParams decoded;
    decoded.name = name_it->get<std::string>();
    decoded.arguments = params.value("arguments", json());
    return decoded;
}

ResourceReadParams decode_resource_read_params(const json& params) {
    if (!params.is_object()) {
        throw InvalidParams("Invalid parameters");
    }
    auto uri_it = params.find("uri");
    if (uri_it == params.end() || !uri_it->is_string()) {
        throw InvalidParams("URI is required");
    }
    return {uri_it->get<std::string>()};
}

Response handle_initialize(const Request& request, const HandlerContext& context) {
    if (request.params.is_object() && request.params.contains("clientInfo")) {
        spdlog::info("Client info: {}", request.params["clientInfo"].dump());
    }

    return make_result(request.id, {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", {
            {"tools", {{"listChanged", true}}},
            {"resources", {{"subscribe", true}, {"listChanged", true}}}
        }},
        {"serverInfo", {
            {"name", context.server_info.name},
            {"version", context.server_info.version}
        }}
    });
}

Response handle_tools_list(const Request& request, const HandlerContext& context) {
    json tools_array = json::array();
    for (const auto& info : context.registry.tools()) {
        tools_array.push_back(to_json(info));
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return make_result(request.id, {{"tools", tools_array}});
}

Response handle_tools_call(const Request& request, const HandlerContext& context) {
    ToolCallParams params;
    try {
        params = decode_tool_call_params(request.params);
    } catch (const InvalidParams& e) {
        return make_failure(request.id, error_code::InvalidParams, e.what());
    }

    if (!context.registry.find_tool(params.name)) {
        spdlog::warn("Tool not found: {}", params.name);
        return make_failure(request.id, error_code::MethodNotFound, "Tool not found");
    }

    ToolOutcome outcome = context.executor.execute(params.name, params.arguments);
    return make_result(request.id, to_result(outcome));
}

Response handle_resources_list(const Request& request, const HandlerContext& context) {
    json resources_array = json::array();
    for (const auto& info : context.registry.resources()) {
        resources_array.push_back(to_json(info));
    }

    spdlog::debug("Returning {} resources", resources_array.size());
    return make_result(request.id, {{"resources", resources_array}});
}

Response handle_resources_read(const Request& request, const HandlerContext& context) {
    ResourceReadParams params;
    try {
        params = decode_resource_read_params(request.params);
    } catch (const InvalidParams& e) {
        return make_failure(request.id, error_code::InvalidParams, e.what());
    }

    if (!context.reader.is_allowed(params.uri)) {
        spdlog::warn("Rejected resource URI: {}", params.uri);
        return make_failure(request.id, error_code::InvalidParams, "Invalid URI scheme");
    }

    std::string text;
    try {
        text = context.reader.read(params.uri);
    } catch (const ResourceError& e) {
        spdlog::error("Failed to read {}: {}", params.uri, e.what());
        return make_failure(request.id, error_code::ResourceNotFound, "Resource not found",
                            json{{"uri", params.uri}, {"reason", e.what()}});
    }

    return make_result(request.id, {
        {"contents", json::array({
            {
                {"uri", params.uri},
                {"mimeType", kResourceMimeType},
                {"text", text}
            }
        })}
    });
}

} // namespace mini_mcp
