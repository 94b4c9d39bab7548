#pragma once

#include <nlohmann/json.hpp>
#include <optional>

namespace mini_mcp {

using json = nlohmann::json;

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages over a concrete
 * channel. The server only sees parsed JSON values.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON message from transport
     *
     * Input that is not valid JSON is logged and skipped.
     * @return JSON message, or std::nullopt on end of input or read error
     */
    virtual std::optional<json> read_message() = 0;

    /**
     * @brief Write JSON message to transport
     * @param message JSON message to write
     * @throws json::exception if the message cannot be serialized; nothing
     *         is written in that case
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace mini_mcp
