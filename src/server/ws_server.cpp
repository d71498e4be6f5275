#include "order_voice/server/ws_server.hpp"

#include <stdexcept>
#include <vector>

#include "order_voice/logging.hpp"
#include "order_voice/metrics.hpp"
#include "order_voice/utils/http.hpp"

namespace order_voice {

namespace {

using Server = websocketpp::server<websocketpp::config::asio>;

// RFC 6455 limits close reasons to 123 bytes.
std::string close_reason(const std::string& reason) {
    return reason.size() <= 123 ? reason : reason.substr(0, 123);
}

class WsTranscriptSubscriber : public TranscriptSubscriber {
public:
    WsTranscriptSubscriber(Server& server, websocketpp::connection_hdl hdl, std::string remote)
        : server_(server),
          hdl_(std::move(hdl)),
          remote_(std::move(remote)) {}

    void send_text(const std::string& payload) override {
        websocketpp::lib::error_code ec;
        server_.send(hdl_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw DeliveryError(ec.message());
        }
    }

    std::string describe() const override { return remote_; }

private:
    Server& server_;
    websocketpp::connection_hdl hdl_;
    std::string remote_;
};

}

WsServer::WsServer(const Config& config,
                   const OrderStore& store,
                   TranscriptHub& hub,
                   ServicesFactory services_factory)
    : config_(config),
      store_(store),
      hub_(hub),
      services_factory_(std::move(services_factory)) {}

WsServer::~WsServer() {
    stop();
}

void WsServer::start() {
    if (running_.exchange(true)) {
        return;
    }
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.clear_error_channels(websocketpp::log::elevel::all);
    server_.init_asio();
    server_.set_reuse_addr(true);

    server_.set_validate_handler([this](ConnectionHdl hdl) { return on_validate(hdl); });
    server_.set_open_handler([this](ConnectionHdl hdl) { on_open(hdl); });
    server_.set_message_handler([this](ConnectionHdl hdl, Server::message_ptr message) {
        on_message(hdl, message);
    });
    server_.set_close_handler([this](ConnectionHdl hdl) { on_closed(hdl); });
    server_.set_fail_handler([this](ConnectionHdl hdl) { on_closed(hdl); });

    websocketpp::lib::error_code ec;
    server_.listen(config_.host, std::to_string(config_.ws_port), ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("WebSocket server failed to listen on " + config_.host + ":" +
                                 std::to_string(config_.ws_port) + ": " + ec.message());
    }
    const auto local = server_.get_local_endpoint(ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("WebSocket server has no local endpoint: " + ec.message());
    }
    bound_port_ = local.port();
    server_.start_accept(ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("WebSocket server failed to accept: " + ec.message());
    }

    server_thread_ = std::thread([this]() {
        logging::info(
            "WebSocket server listening",
            {kv("host", config_.host), kv("port", bound_port_.load())});
        try {
            server_.run();
        } catch (const std::exception& ex) {
            logging::error("WebSocket server loop failed", {kv("error", ex.what())});
        }
    });
}

void WsServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    websocketpp::lib::error_code ec;
    server_.stop_listening(ec);

    std::vector<ConnectionHdl> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : connections_) {
            open.push_back(entry.first);
        }
    }
    for (const auto& hdl : open) {
        close_connection(hdl, websocketpp::close::status::going_away, "shutdown");
    }

    // Connections that never finished closing are released here.
    std::map<ConnectionHdl, Connection, std::owner_less<ConnectionHdl>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(connections_);
    }
    for (auto& entry : remaining) {
        release(entry.second);
    }

    server_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

std::size_t WsServer::voice_session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : connections_) {
        if (entry.second.session) {
            ++count;
        }
    }
    return count;
}

bool WsServer::on_validate(ConnectionHdl hdl) {
    auto connection = server_.get_con_from_hdl(hdl);
    const auto path = utils::resource_path(connection->get_resource());
    if (path == kVoicePath || path == kTranscriptionPath) {
        return true;
    }
    logging::warn("Rejecting WebSocket upgrade", {kv("path", path)});
    connection->set_status(websocketpp::http::status_code::not_found);
    return false;
}

void WsServer::on_open(ConnectionHdl hdl) {
    auto connection = server_.get_con_from_hdl(hdl);
    const auto path = utils::resource_path(connection->get_resource());
    const auto remote = connection->get_remote_endpoint();
    if (path == kVoicePath) {
        open_voice_session(hdl, remote);
    } else {
        open_transcription(hdl, remote);
    }
}

void WsServer::open_voice_session(ConnectionHdl hdl, const std::string& remote) {
    if (!config_.groq_api_key) {
        Metrics::instance().session_refused();
        logging::error("Missing GROQ_API_KEY environment variable; refusing WebSocket connection",
                       {kv("remote", remote)});
        close_connection(hdl, websocketpp::close::status::internal_endpoint_error,
                         "Missing GROQ_API_KEY");
        return;
    }

    SpeechServices services;
    try {
        services = services_factory_(config_);
    } catch (const std::exception& ex) {
        Metrics::instance().session_refused();
        logging::error("Speech services unavailable; refusing WebSocket connection",
                       {kv("remote", remote), kv("error", ex.what())});
        close_connection(hdl, websocketpp::close::status::internal_endpoint_error,
                         close_reason(ex.what()));
        return;
    }

    const auto session_id = "voice-" + std::to_string(++next_session_id_);
    auto send = [this, hdl](const std::string& payload) {
        websocketpp::lib::error_code ec;
        server_.send(hdl, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw DeliveryError("send to voice client failed: " + ec.message());
        }
    };
    auto session = std::make_shared<VoiceSession>(session_id, config_, std::move(services),
                                                  store_, hub_, std::move(send));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[hdl] = Connection{Route::Voice, remote, session, nullptr};
    }
    logging::info("WebSocket connection established",
                  {kv("remote", remote), kv("session_id", session_id)});

    session->start([this, hdl](const std::string& reason) {
        close_connection(hdl, websocketpp::close::status::internal_endpoint_error,
                         close_reason(reason));
    });
}

void WsServer::open_transcription(ConnectionHdl hdl, const std::string& remote) {
    auto subscriber = std::make_shared<WsTranscriptSubscriber>(server_, hdl, remote);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[hdl] = Connection{Route::Transcription, remote, nullptr, subscriber};
    }
    logging::info("Transcription observer connected", {kv("remote", remote)});
    hub_.subscribe(subscriber);
}

void WsServer::on_message(ConnectionHdl hdl, Server::message_ptr message) {
    std::shared_ptr<VoiceSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = connections_.find(hdl);
        if (it == connections_.end() || it->second.route != Route::Voice) {
            // Observers have nothing to say; their payloads are ignored.
            return;
        }
        session = it->second.session;
    }
    if (message->get_opcode() != websocketpp::frame::opcode::text) {
        logging::debug("Ignoring binary frame", {kv("session_id", session->id())});
        return;
    }
    session->receive(message->get_payload());
}

void WsServer::on_closed(ConnectionHdl hdl) {
    Connection connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = connections_.find(hdl);
        if (it == connections_.end()) {
            return;
        }
        connection = std::move(it->second);
        connections_.erase(it);
    }
    release(connection);
}

void WsServer::close_connection(ConnectionHdl hdl,
                                websocketpp::close::status::value code,
                                const std::string& reason) {
    websocketpp::lib::error_code ec;
    server_.close(hdl, code, reason, ec);
    if (ec) {
        logging::debug("WebSocket close failed", {kv("error", ec.message())});
    }
}

void WsServer::release(Connection& connection) {
    if (connection.session) {
        connection.session->close();
        logging::info("WebSocket connection closed",
                      {kv("remote", connection.remote),
                       kv("session_id", connection.session->id())});
    }
    if (connection.subscriber) {
        hub_.unsubscribe(connection.subscriber);
        logging::info("Transcription observer disconnected", {kv("remote", connection.remote)});
    }
}

}
