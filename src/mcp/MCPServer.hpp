#pragma once

#include "Dispatcher.hpp"
#include "ITransport.hpp"
#include "Registry.hpp"
#include "ResourceReader.hpp"
#include "ToolExecutor.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mini_mcp {

using json = nlohmann::json;

inline constexpr const char* kDefaultServerName = "mini-mcp";
inline constexpr const char* kDefaultServerVersion = "0.1.0";

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Owns the tool/resource registry and runs the request loop over a
 * transport. Supports methods: initialize, tools/list, tools/call,
 * resources/list, resources/read.
 *
 * Tools, resources and resource readers are registered before run();
 * the registry is sealed for the lifetime of the loop.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param info Name and version reported by initialize
     */
    MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info);

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws std::invalid_argument on duplicate or invalid tool
     * @throws std::logic_error once run() has started
     */
    void register_tool(ToolInfo info, ToolHandler handler);

    /**
     * @brief Register a resource for resources/list
     * @throws std::invalid_argument on duplicate or empty URI
     * @throws std::logic_error once run() has started
     */
    void register_resource(ResourceInfo info);

    /**
     * @brief Replace the content reader for an allowed URI scheme
     * @throws std::invalid_argument for a scheme outside the allow-list
     * @throws std::logic_error once run() has started
     */
    void set_resource_reader(const std::string& scheme, ReadFunction fn);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport closes.
     * Reads requests, dispatches them, sends one response per request.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     *
     * Safe to call from a signal handler. The flag is checked between
     * requests, so a read already in progress completes first.
     */
    void stop();

    /**
     * @brief Handle one incoming message
     * @param message Parsed JSON value read from the transport
     * @return Encoded response, or std::nullopt if the message is not a
     *         request and must be dropped
     */
    std::optional<json> handle_message(json message) const;

    const Registry& registry() const { return registry_; }
    const Dispatcher& dispatcher() const { return dispatcher_; }

private:
    std::unique_ptr<ITransport> transport_;
    ServerInfo info_;
    Registry registry_;
    ResourceReader reader_;
    ToolExecutor executor_;
    Dispatcher dispatcher_;
    std::atomic<bool> running_{false};
};

} // namespace mini_mcp
