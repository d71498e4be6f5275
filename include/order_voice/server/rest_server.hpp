#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "order_voice/config.hpp"
#include "order_voice/store/order_store.hpp"

namespace order_voice {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

// Service banner, store health and Prometheus metrics over HTTP.
class RestServer {
public:
    using HealthProvider = std::function<StoreHealth()>;

    RestServer(const Config& config, HealthProvider health);

    void start();
    void stop();

    static RestResponse root_response();
    static RestResponse health_response(const StoreHealth& health);

private:
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    HealthProvider health_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
