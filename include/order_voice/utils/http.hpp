#pragma once

#include <string>

namespace order_voice::utils {

struct Endpoint {
    std::string scheme = "http";
    std::string host;
    int port = 80;
    std::string base_path = "/";

    // scheme://host[:port], the port omitted when it is the scheme default.
    std::string origin() const;
    // Appends `path` to base_path with exactly one separating slash.
    std::string join(const std::string& path) const;
};

// Throws std::invalid_argument on a malformed port.
Endpoint parse_endpoint(const std::string& url);

// "/api/ws?token=x" -> "/api/ws"; a trailing slash is dropped.
std::string resource_path(const std::string& resource);

}
