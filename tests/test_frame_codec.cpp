#include <catch2/catch_test_macros.hpp>

#include "order_voice/transport/frame_codec.hpp"

#include <nlohmann/json.hpp>

using order_voice::AudioChunk;
using order_voice::TransportMessage;
namespace transport = order_voice::transport;

TEST_CASE("inbound audio becomes an AudioChunk with configured defaults") {
    const auto frame = transport::decode_client_message(
        R"({"type":"audio","data":"AAEC"})", 24000);
    REQUIRE(frame.has_value());
    const auto* chunk = std::get_if<AudioChunk>(&*frame);
    REQUIRE(chunk != nullptr);
    REQUIRE(chunk->bytes == std::vector<uint8_t>{0x00, 0x01, 0x02});
    REQUIRE(chunk->sample_rate == 24000);
    REQUIRE(chunk->channels == 1);
}

TEST_CASE("inbound audio honours explicit format fields") {
    const auto frame = transport::decode_client_message(
        R"({"type":"audio","data":"AAEC","sample_rate":8000,"channels":2})", 16000);
    REQUIRE(frame.has_value());
    const auto& chunk = std::get<AudioChunk>(*frame);
    REQUIRE(chunk.sample_rate == 8000);
    REQUIRE(chunk.channels == 2);
}

TEST_CASE("client messages, unknown types and junk are dropped") {
    REQUIRE_FALSE(transport::decode_client_message(R"({"type":"message","data":{"a":1}})", 16000));
    REQUIRE_FALSE(transport::decode_client_message(R"({"type":"ping"})", 16000));
    REQUIRE_FALSE(transport::decode_client_message(R"({"type":"audio","data":""})", 16000));
    REQUIRE_FALSE(transport::decode_client_message(R"({"type":"audio","data":"@@"})", 16000));
    REQUIRE_FALSE(transport::decode_client_message("not json", 16000));
}

TEST_CASE("outbound frames are wrapped for the browser client") {
    const auto audio = nlohmann::json::parse(
        transport::encode_audio(AudioChunk{{0x00, 0x01, 0x02}, 22050, 1}));
    REQUIRE(audio["type"] == "audio");
    REQUIRE(audio["data"] == "AAEC");
    REQUIRE(audio["sample_rate"] == 22050);

    const auto state = nlohmann::json::parse(
        transport::encode_message(TransportMessage{R"({"type":"state","value":"listening"})"}));
    REQUIRE(state["type"] == "message");
    REQUIRE(state["data"]["value"] == "listening");

    const auto error = nlohmann::json::parse(
        transport::encode_message(transport::make_error_message("Sorry")));
    REQUIRE(error["data"]["type"] == "error");
    REQUIRE(error["data"]["message"] == "Sorry");
}

TEST_CASE("out of range or fractional format fields fall back to defaults") {
    const char* payloads[] = {
        R"({"type":"audio","data":"AAEC","sample_rate":1e20,"channels":3e9})",
        R"({"type":"audio","data":"AAEC","sample_rate":3000000000,"channels":70000})",
        R"({"type":"audio","data":"AAEC","sample_rate":-16000,"channels":0})",
        R"({"type":"audio","data":"AAEC","sample_rate":4000,"channels":9})",
        R"({"type":"audio","data":"AAEC","sample_rate":16000.5,"channels":"2"})",
    };
    for (const auto* payload : payloads) {
        const auto frame = transport::decode_client_message(payload, 16000);
        REQUIRE(frame.has_value());
        const auto& chunk = std::get<AudioChunk>(*frame);
        CHECK(chunk.sample_rate == 16000);
        CHECK(chunk.channels == 1);
    }

    const auto edge = transport::decode_client_message(
        R"({"type":"audio","data":"AAEC","sample_rate":192000,"channels":8})", 16000);
    REQUIRE(edge.has_value());
    CHECK(std::get<AudioChunk>(*edge).sample_rate == 192000);
    CHECK(std::get<AudioChunk>(*edge).channels == 8);
}
