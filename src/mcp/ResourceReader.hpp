#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>

namespace mini_mcp {

/**
 * @brief Raised by a read function when content cannot be resolved
 */
class ResourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Function resolving a URI to its text content
 * @throws ResourceError if the content cannot be resolved
 */
using ReadFunction = std::function<std::string(const std::string& uri)>;

/**
 * @brief Resolves resource content by URI scheme
 *
 * Only URIs starting with one of the allowed scheme prefixes
 * ("file://", "https://") can be read. Each allowed scheme starts with a
 * placeholder reader that can be replaced during setup.
 */
class ResourceReader {
public:
    ResourceReader();

    /**
     * @brief Replace the read function for an allowed scheme
     * @param scheme Scheme prefix, e.g. "file://"
     * @throws std::invalid_argument if the scheme is not allowed or fn is null
     */
    void set_reader(const std::string& scheme, ReadFunction fn);

    /**
     * @brief Check URI against the scheme allow-list (literal prefix match)
     */
    bool is_allowed(const std::string& uri) const;

    /**
     * @brief Resolve URI content
     * @throws std::invalid_argument if the URI scheme is not allowed
     * @throws ResourceError if the read function fails
     */
    std::string read(const std::string& uri) const;

private:
    const ReadFunction* find_reader(const std::string& uri) const;

    std::map<std::string, ReadFunction> readers_;
};

} // namespace mini_mcp
