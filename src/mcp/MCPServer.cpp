#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mini_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info)
    : transport_(std::move(transport)),
      info_(std::move(info)),
      executor_(registry_),
      dispatcher_(HandlerContext{info_, registry_, executor_, reader_}) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized: {} {}", info_.name, info_.version);
}

void MCPServer::register_tool(ToolInfo info, ToolHandler handler) {
    registry_.register_tool(std::move(info), std::move(handler));
}

void MCPServer::register_resource(ResourceInfo info) {
    registry_.register_resource(std::move(info));
}

void MCPServer::set_resource_reader(const std::string& scheme, ReadFunction fn) {
    if (registry_.sealed()) {
        throw std::logic_error("Resource readers cannot change while the server is running");
    }
    reader_.set_reader(scheme, std::move(fn));
}

void MCPServer::run() {
    registry_.seal();
    running_ = true;
    spdlog::info("MCPServer starting main loop ({} tools, {} resources)",
                 registry_.tool_count(), registry_.resource_count());

    while (running_ && transport_->is_open()) {
        std::optional<json> message = transport_->read_message();
        if (!message) {
            spdlog::info("Transport closed, stopping server");
            break;
        }

        std::optional<json> response = handle_message(std::move(*message));
        if (!response) {
            continue;
        }

        try {
            transport_->write_message(*response);
        } catch (const json::exception& e) {
            spdlog::error("Failed to serialize response: {}", e.what());
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    running_ = false;
}

std::optional<json> MCPServer::handle_message(json message) const {
    Request request;
    try {
        request = parse_request(std::move(message));
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Dropping malformed request: {}", e.what());
        return std::nullopt;
    }

    Response response = dispatcher_.dispatch(request);
    return to_json(response);
}

} // namespace mini_mcp
