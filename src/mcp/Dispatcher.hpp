#pragma once

#include "Handlers.hpp"
#include "Message.hpp"
#include <map>
#include <string>
#include <vector>

namespace mini_mcp {

using MethodHandler = Response (*)(const Request&, const HandlerContext&);

/**
 * @brief Routes requests to method handlers
 *
 * The method table is fixed at construction: initialize, tools/list,
 * tools/call, resources/list, resources/read.
 */
class Dispatcher {
public:
    explicit Dispatcher(HandlerContext context);

    /**
     * @brief Produce the response for a request
     *
     * Never throws: a wrong jsonrpc version yields -32600, an unknown method
     * -32601, and an exception escaping a handler -32603.
     */
    Response dispatch(const Request& request) const;

    /// Supported method names, sorted
    std::vector<std::string> methods() const;

private:
    HandlerContext context_;
    const std::map<std::string, MethodHandler> handlers_;
};

} // namespace mini_mcp
