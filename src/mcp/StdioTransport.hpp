#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace mini_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads one JSON message per line, skipping blank and unparseable lines
 * as well as lines nested deeper than kMaxNestingDepth.
 * Writes one JSON message per line and flushes after each.
 */
class StdioTransport : public ITransport {
public:
    /// Deepest object/array nesting accepted on an input line
    static constexpr int kMaxNestingDepth = 256;

    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<json> read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
    bool closed_ = false;
};

} // namespace mini_mcp
