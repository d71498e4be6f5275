#include "order_voice/utils/http.hpp"

#include <stdexcept>

#include "order_voice/utils/text.hpp"

namespace order_voice::utils {

namespace {

int default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

}

std::string Endpoint::origin() const {
    std::string out = scheme + "://" + host;
    if (port > 0 && port != default_port(scheme)) {
        out += ":" + std::to_string(port);
    }
    return out;
}

std::string Endpoint::join(const std::string& path) const {
    if (base_path.empty() || base_path == "/") {
        if (path.empty()) {
            return "/";
        }
        return path.front() == '/' ? path : "/" + path;
    }
    if (path.empty()) {
        return base_path;
    }
    const bool base_slash = base_path.back() == '/';
    const bool path_slash = path.front() == '/';
    if (base_slash && path_slash) {
        return base_path + path.substr(1);
    }
    if (!base_slash && !path_slash) {
        return base_path + "/" + path;
    }
    return base_path + path;
}

Endpoint parse_endpoint(const std::string& url) {
    Endpoint endpoint;
    std::string rest = url;

    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        endpoint.scheme = to_lower(rest.substr(0, scheme_end));
        rest.erase(0, scheme_end + 3);
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        endpoint.base_path = rest.substr(slash);
        rest.erase(slash);
    }

    const auto colon = rest.find(':');
    if (colon == std::string::npos) {
        endpoint.host = rest;
        endpoint.port = default_port(endpoint.scheme);
        return endpoint;
    }
    endpoint.host = rest.substr(0, colon);
    try {
        std::size_t consumed = 0;
        const auto port_text = rest.substr(colon + 1);
        endpoint.port = std::stoi(port_text, &consumed);
        if (consumed != port_text.size()) {
            throw std::invalid_argument(port_text);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port in url: " + url);
    }
    return endpoint;
}

std::string resource_path(const std::string& resource) {
    std::string path = resource.substr(0, resource.find_first_of("?#"));
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path.empty() ? "/" : path;
}

}
