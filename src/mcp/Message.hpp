#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace mini_mcp {

using json = nlohmann::json;

/// JSON-RPC version string every request must carry
inline constexpr const char* kJsonRpcVersion = "2.0";

/// Reserved JSON-RPC / MCP error codes
namespace error_code {
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ResourceNotFound = -32002;
} // namespace error_code

/**
 * @brief Decoded JSON-RPC request
 *
 * Fields missing on the wire are filled with defaults: empty version,
 * null id, empty method, null params.
 */
struct Request {
    std::string jsonrpc;
    json id;            // string, number or null; echoed back untouched
    std::string method;
    json params;
};

/**
 * @brief JSON-RPC error object
 */
struct ErrorInfo {
    int code = 0;
    std::string message;
    std::optional<json> data;
};

/**
 * @brief JSON-RPC response
 *
 * Outcome holds either the result value or the error, never both.
 */
struct Response {
    json id;
    std::variant<json, ErrorInfo> outcome;

    bool is_error() const { return std::holds_alternative<ErrorInfo>(outcome); }
    const json& result() const { return std::get<json>(outcome); }
    const ErrorInfo& error() const { return std::get<ErrorInfo>(outcome); }
};

/**
 * @brief Decode a request from a parsed JSON value
 * @param message Parsed JSON line; id and params are moved out of it
 * @return Decoded request
 * @throws std::invalid_argument if the value does not have the request shape
 */
Request parse_request(json message);

/**
 * @brief Build a successful response
 */
Response make_result(const json& id, json result);

/**
 * @brief Build an error response
 */
Response make_failure(const json& id, int code, std::string message,
                      std::optional<json> data = std::nullopt);

/**
 * @brief Encode a response as a JSON-RPC 2.0 object
 */
json to_json(const Response& response);

/**
 * @brief Decode a JSON-RPC 2.0 response object
 * @throws std::invalid_argument unless exactly one of result/error is present
 */
Response parse_response(const json& message);

bool operator==(const ErrorInfo& lhs, const ErrorInfo& rhs);
bool operator==(const Response& lhs, const Response& rhs);

} // namespace mini_mcp
