#include "Dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace mini_mcp {

Dispatcher::Dispatcher(HandlerContext context)
    : context_(context),
      handlers_{
          {"initialize", &handle_initialize},
          {"tools/list", &handle_tools_list},
          {"tools/call", &handle_tools_call},
          {"resources/list", &handle_resources_list},
          {"resources/read", &handle_resources_read}
      } {
}

Response Dispatcher::dispatch(const Request& request) const {
    if (request.jsonrpc != kJsonRpcVersion) {
        spdlog::warn("Rejected request with jsonrpc version '{}'", request.jsonrpc);
        return make_failure(request.id, error_code::InvalidRequest, "Invalid Request");
    }

    auto it = handlers_.find(request.method);
    if (it == handlers_.end()) {
        spdlog::warn("Method not found: {}", request.method);
        return make_failure(request.id, error_code::MethodNotFound, "Method not found");
    }

    spdlog::debug("Handling request: method={}, id={}", request.method, request.id.dump());

    try {
        return it->second(request, context_);
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", request.method, e.what());
        return make_failure(request.id, error_code::InternalError, "Internal error", json(e.what()));
    }
}

std::vector<std::string> Dispatcher::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace mini_mcp
