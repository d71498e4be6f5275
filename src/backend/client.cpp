#include "order_voice/backend/client.hpp"

#include <httplib.h>
#include <utility>

#include "order_voice/utils/http.hpp"

namespace order_voice {

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> api_key,
                             BackendRequestOptions options)
    : endpoint_(utils::parse_endpoint(base_url)),
      api_key_(std::move(api_key)),
      options_(options) {
    if (endpoint_.host.empty()) {
        throw BackendError("Backend URL has no host: " + base_url);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (endpoint_.scheme == "https") {
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    auto client = make_client();
    auto headers = make_headers("application/json");
    const auto full_path = endpoint_.join(path);
    auto response = client->Post(full_path, headers, body.dump(), "application/json");
    check_response(response, full_path);
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError("Backend returned invalid JSON from " + full_path + ": " + ex.what());
    }
}

nlohmann::json BackendClient::post_multipart(const std::string& path,
                                             const std::vector<MultipartField>& fields) {
    auto client = make_client();
    auto headers = make_headers("application/json");
    httplib::MultipartFormDataItems items;
    for (const auto& field : fields) {
        items.push_back({field.name, field.content, field.filename, field.content_type});
    }
    const auto full_path = endpoint_.join(path);
    auto response = client->Post(full_path, headers, items);
    check_response(response, full_path);
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError("Backend returned invalid JSON from " + full_path + ": " + ex.what());
    }
}

std::string BackendClient::post_json_binary(const std::string& path,
                                            const nlohmann::json& body) {
    auto client = make_client();
    auto headers = make_headers("*/*");
    const auto full_path = endpoint_.join(path);
    auto response = client->Post(full_path, headers, body.dump(), "application/json");
    check_response(response, full_path);
    return response->body;
}

std::unique_ptr<httplib::Client> BackendClient::make_client() const {
    auto client = std::make_unique<httplib::Client>(
        endpoint_.origin());
    client->set_connection_timeout(options_.connect_timeout.count(), 0);
    client->set_read_timeout(options_.sock_read_timeout.count(), 0);
    client->set_write_timeout(options_.request_timeout.count(), 0);
    return client;
}

httplib::Headers BackendClient::make_headers(const std::string& accept) const {
    httplib::Headers headers{{"Accept", accept}};
    if (api_key_) {
        headers.emplace("Authorization", "Bearer " + *api_key_);
    }
    return headers;
}

void BackendClient::check_response(const httplib::Result& response,
                                   const std::string& path) const {
    if (!response) {
        throw BackendError("Backend request failed: " + path + " (" +
                           httplib::to_string(response.error()) + ")");
    }
    if (response->status == 401 || response->status == 403) {
        throw BackendPermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("Backend returned " + std::to_string(response->status) + " for " +
                           path + ": " + response->body);
    }
}

}
