#include "order_voice/server/rest_server.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/metrics.hpp"

namespace order_voice {

RestServer::RestServer(const Config& config, HealthProvider health)
    : config_(config),
      health_(std::move(health)) {}

RestResponse RestServer::root_response() {
    return {200, {{"message", "Voice Model Service is running"}}};
}

RestResponse RestServer::health_response(const StoreHealth& health) {
    return {200,
            {{"status", health.healthy() ? "healthy" : "unhealthy"},
             {"database", health.database()},
             {"message", health.message}}};
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"}});

    server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        write_json(res, root_response());
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        StoreHealth health;
        try {
            health = health_ ? health_() : StoreHealth{};
        } catch (const std::exception& ex) {
            logging::error("Health check failed", {kv("error", ex.what())});
            health.status = StoreStatus::Invalid;
            health.message = ex.what();
        }
        write_json(res, health_response(health));
        logging::debug("Health check served", {kv("database", health.database())});
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "*");
        res.status = 204;
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("host", config_.host), kv("port", config_.rest_api_port)});
        if (!server_->listen(config_.host, config_.rest_api_port)) {
            logging::error("REST server failed to listen",
                           {kv("host", config_.host), kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
