#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "order_voice/backend/speech_services.hpp"
#include "order_voice/config.hpp"
#include "order_voice/session/voice_session.hpp"
#include "order_voice/store/order_store.hpp"
#include "order_voice/transcript/hub.hpp"

namespace order_voice {

// Serves voice sessions on /api/ws and transcript observers on
// /api/transcription. One asio thread drives every connection.
class WsServer {
public:
    using ServicesFactory = std::function<SpeechServices(const Config&)>;

    static constexpr const char* kVoicePath = "/api/ws";
    static constexpr const char* kTranscriptionPath = "/api/transcription";

    WsServer(const Config& config,
             const OrderStore& store,
             TranscriptHub& hub,
             ServicesFactory services_factory);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    void start();
    void stop();

    std::size_t voice_session_count() const;

    // The port actually bound by start(); differs from ws_port when that is 0.
    uint16_t port() const { return bound_port_; }

private:
    using Server = websocketpp::server<websocketpp::config::asio>;
    using ConnectionHdl = websocketpp::connection_hdl;

    enum class Route {
        Voice,
        Transcription
    };

    struct Connection {
        Route route;
        std::string remote;
        std::shared_ptr<VoiceSession> session;
        std::shared_ptr<TranscriptSubscriber> subscriber;
    };

    bool on_validate(ConnectionHdl hdl);
    void on_open(ConnectionHdl hdl);
    void on_message(ConnectionHdl hdl, Server::message_ptr message);
    void on_closed(ConnectionHdl hdl);

    void open_voice_session(ConnectionHdl hdl, const std::string& remote);
    void open_transcription(ConnectionHdl hdl, const std::string& remote);
    void close_connection(ConnectionHdl hdl,
                          websocketpp::close::status::value code,
                          const std::string& reason);
    void release(Connection& connection);

    const Config& config_;
    const OrderStore& store_;
    TranscriptHub& hub_;
    ServicesFactory services_factory_;

    Server server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> next_session_id_{0};
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex mutex_;
    std::map<ConnectionHdl, Connection, std::owner_less<ConnectionHdl>> connections_;
};

}
