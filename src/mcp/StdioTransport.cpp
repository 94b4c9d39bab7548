#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace mini_mcp {

namespace {

class NestingTooDeep : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejects the line as soon as a container opens past the nesting limit
bool limit_depth(int depth, json::parse_event_t event, json&) {
    if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start)
        && depth >= StdioTransport::kMaxNestingDepth) {
        throw NestingTooDeep("JSON nesting exceeds " + std::to_string(StdioTransport::kMaxNestingDepth)
                             + " levels");
    }
    return true;
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<json> StdioTransport::read_message() {
    std::string line;

    while (!closed_) {
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
            } else {
                spdlog::error("Error reading from input stream");
            }
            closed_ = true;
            break;
        }

        if (is_blank(line)) {
            continue;
        }

        try {
            json message = json::parse(line, limit_depth);
            spdlog::debug("Read message: {}", line);
            return message;
        } catch (const json::parse_error& e) {
            spdlog::warn("Dropping unparseable input line: {}", e.what());
        } catch (const NestingTooDeep& e) {
            spdlog::warn("Dropping input line: {}", e.what());
        }
    }

    return std::nullopt;
}

void StdioTransport::write_message(const json& message) {
    // Serialize fully before touching the stream
    std::string serialized = message.dump();
    out_ << serialized << '\n';
    out_.flush();

    if (!out_) {
        spdlog::error("Error writing to output stream");
        closed_ = true;
        return;
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !closed_ && !in_.bad() && out_.good();
}

} // namespace mini_mcp
