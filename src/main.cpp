#include "order_voice/backend/speech_services.hpp"
#include "order_voice/config.hpp"
#include "order_voice/logging.hpp"
#include "order_voice/server/rest_server.hpp"
#include "order_voice/server/ws_server.hpp"
#include "order_voice/store/order_store.hpp"
#include "order_voice/transcript/hub.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}

}

int main() {
    try {
        const auto config = order_voice::Config::load();
        config.validate();
        order_voice::logging::init(config);
        order_voice::info(
            "Starting order-voice",
            {order_voice::kv("host", config.host),
             order_voice::kv("rest_port", config.rest_api_port),
             order_voice::kv("ws_port", config.ws_port),
             order_voice::kv("store_path", config.store_path.string()),
             order_voice::kv("speech_backend_configured", config.groq_api_key.has_value())});

        order_voice::OrderStore store;
        const auto health = order_voice::check_store(config.store_path, &store);
        if (health.healthy()) {
            order_voice::info(
                "Order store loaded",
                {order_voice::kv("orders", store.order_count()),
                 order_voice::kv("products", store.product_count())});
        } else {
            order_voice::warn(
                "Order store unavailable",
                {order_voice::kv("database", health.database()),
                 order_voice::kv("message", health.message)});
        }

        order_voice::TranscriptHub hub;
        order_voice::RestServer rest(config, [health]() { return health; });
        order_voice::WsServer ws(config, store, hub, order_voice::make_groq_services);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        ws.start();
        rest.start();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        order_voice::info("Shutting down");
        rest.stop();
        ws.stop();
        order_voice::logging::shutdown();
    } catch (const std::exception& ex) {
        order_voice::error(
            "Startup failed",
            {order_voice::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
