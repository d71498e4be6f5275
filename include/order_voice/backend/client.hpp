#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "order_voice/utils/http.hpp"

namespace order_voice {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message) {}
};

struct BackendRequestOptions {
    std::chrono::seconds request_timeout{60};
    std::chrono::seconds connect_timeout{60};
    std::chrono::seconds sock_read_timeout{60};
};

struct MultipartField {
    std::string name;
    std::string content;
    std::string filename;
    std::string content_type;
};

// Thin HTTP client for an OpenAI-compatible API rooted at base_url.
// A fresh connection is used per request so calls may run concurrently.
class BackendClient {
public:
    BackendClient(std::string base_url,
                  std::optional<std::string> api_key,
                  BackendRequestOptions options);

    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json post_multipart(const std::string& path,
                                  const std::vector<MultipartField>& fields);
    // Returns the raw response body, e.g. synthesized audio.
    std::string post_json_binary(const std::string& path, const nlohmann::json& body);

private:
    std::unique_ptr<httplib::Client> make_client() const;
    httplib::Headers make_headers(const std::string& accept) const;
    void check_response(const httplib::Result& response, const std::string& path) const;

    utils::Endpoint endpoint_;
    std::optional<std::string> api_key_;
    BackendRequestOptions options_;
};

}
