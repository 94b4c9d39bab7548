#include "Message.hpp"
#include <stdexcept>

namespace mini_mcp {

namespace {

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

} // namespace

Request parse_request(json message) {
    if (!message.is_object()) {
        throw std::invalid_argument("Request must be a JSON object");
    }

    Request request;

    auto version_it = message.find("jsonrpc");
    if (version_it != message.end()) {
        if (!version_it->is_string()) {
            throw std::invalid_argument("jsonrpc must be a string");
        }
        request.jsonrpc = version_it->get<std::string>();
    }

    auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!is_valid_id(*id_it)) {
            throw std::invalid_argument("id must be a string, number or null");
        }
        request.id = std::move(*id_it);
    }

    auto method_it = message.find("method");
    if (method_it != message.end()) {
        if (!method_it->is_string()) {
            throw std::invalid_argument("method must be a string");
        }
        request.method = method_it->get<std::string>();
    }

    auto params_it = message.find("params");
    if (params_it != message.end()) {
        request.params = std::move(*params_it);
    }

    return request;
}

Response make_result(const json& id, json result) {
    return Response{id, std::move(result)};
}

Response make_failure(const json& id, int code, std::string message,
                      std::optional<json> data) {
    return Response{id, ErrorInfo{code, std::move(message), std::move(data)}};
}

json to_json(const Response& response) {
    json message = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", response.id}
    };

    if (response.is_error()) {
        const ErrorInfo& error = response.error();
        json error_json = {
            {"code", error.code},
            {"message", error.message}
        };
        if (error.data) {
            error_json["data"] = *error.data;
        }
        message["error"] = std::move(error_json);
    } else {
        message["result"] = response.result();
    }

    return message;
}

Response parse_response(const json& message) {
    if (!message.is_object()) {
        throw std::invalid_argument("Response must be a JSON object");
    }
    auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || *version_it != kJsonRpcVersion) {
        throw std::invalid_argument("Response jsonrpc must be \"2.0\"");
    }

    bool has_result = message.contains("result");
    bool has_error = message.contains("error");
    if (has_result == has_error) {
        throw std::invalid_argument("Response must contain exactly one of result or error");
    }

    json id = message.value("id", json());

    if (has_result) {
        return make_result(id, message["result"]);
    }

    const json& error = message["error"];
    if (!error.is_object() || !error.contains("code") || !error["code"].is_number_integer()
        || !error.contains("message") || !error["message"].is_string()) {
        throw std::invalid_argument("Malformed error object");
    }

    std::optional<json> data;
    if (error.contains("data")) {
        data = error["data"];
    }

    return make_failure(id, error["code"].get<int>(),
                        error["message"].get<std::string>(), std::move(data));
}

bool operator==(const ErrorInfo& lhs, const ErrorInfo& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message && lhs.data == rhs.data;
}

bool operator==(const Response& lhs, const Response& rhs) {
    return lhs.id == rhs.id && lhs.outcome == rhs.outcome;
}

} // namespace mini_mcp
