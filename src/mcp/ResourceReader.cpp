#include "ResourceReader.hpp"
#include <spdlog/spdlog.h>

namespace mini_mcp {

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

ResourceReader::ResourceReader() {
    readers_["file://"] = [](const std::string& uri) {
        return "Content of " + uri;
    };
    readers_["https://"] = [](const std::string& uri) {
        return "Web content of " + uri;
    };
}

void ResourceReader::set_reader(const std::string& scheme, ReadFunction fn) {
    if (readers_.count(scheme) == 0) {
        throw std::invalid_argument("URI scheme not allowed: " + scheme);
    }
    if (!fn) {
        throw std::invalid_argument("Read function cannot be null");
    }
    readers_[scheme] = std::move(fn);
    spdlog::debug("Installed reader for scheme {}", scheme);
}

bool ResourceReader::is_allowed(const std::string& uri) const {
    return find_reader(uri) != nullptr;
}

std::string ResourceReader::read(const std::string& uri) const {
    const ReadFunction* reader = find_reader(uri);
    if (!reader) {
        throw std::invalid_argument("Invalid URI scheme: " + uri);
    }
    spdlog::debug("Reading resource: {}", uri);
    return (*reader)(uri);
}

const ReadFunction* ResourceReader::find_reader(const std::string& uri) const {
    for (const auto& [scheme, fn] : readers_) {
        if (starts_with(uri, scheme)) {
            return &fn;
        }
    }
    return nullptr;
}

} // namespace mini_mcp
