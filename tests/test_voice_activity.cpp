#include <catch2/catch_test_macros.hpp>

#include "order_voice/stages/audio_logger.hpp"
#include "order_voice/stages/voice_activity.hpp"

#include <cstdint>
#include <vector>

using namespace order_voice;
using order_voice::stages::VoiceActivityOptions;
using order_voice::stages::VoiceActivityStage;

namespace {

// 10 ms of mono 16 kHz audio at a constant level.
AudioChunk chunk_10ms(int16_t level) {
    AudioChunk chunk;
    for (int i = 0; i < 160; ++i) {
        chunk.bytes.push_back(static_cast<uint8_t>(level & 0xFF));
        chunk.bytes.push_back(static_cast<uint8_t>((level >> 8) & 0xFF));
    }
    return chunk;
}

VoiceActivityStage make_detector() {
    VoiceActivityOptions options;
    options.min_volume = 0.02;
    options.start_ms = 30;
    options.stop_ms = 20;
    return VoiceActivityStage(options);
}

}

TEST_CASE("speech starts after enough loud audio and ends after enough quiet") {
    auto vad = make_detector();

    REQUIRE(vad.handle(chunk_10ms(8000), Direction::Downstream).size() == 1);
    REQUIRE(vad.handle(chunk_10ms(8000), Direction::Downstream).size() == 1);
    const auto started = vad.handle(chunk_10ms(8000), Direction::Downstream);
    REQUIRE(started.size() == 2);
    REQUIRE(is_lifecycle(started[0].frame, LifecycleKind::UserStarted));
    REQUIRE(std::holds_alternative<AudioChunk>(started[1].frame));
    REQUIRE(vad.speaking());

    REQUIRE(vad.handle(chunk_10ms(0), Direction::Downstream).size() == 1);
    const auto stopped = vad.handle(chunk_10ms(0), Direction::Downstream);
    REQUIRE(stopped.size() == 2);
    REQUIRE(std::holds_alternative<AudioChunk>(stopped[0].frame));
    REQUIRE(is_lifecycle(stopped[1].frame, LifecycleKind::UserStopped));
    REQUIRE_FALSE(vad.speaking());
}

TEST_CASE("short bursts and short pauses do not toggle speech") {
    auto vad = make_detector();
    vad.handle(chunk_10ms(8000), Direction::Downstream);
    vad.handle(chunk_10ms(8000), Direction::Downstream);
    vad.handle(chunk_10ms(0), Direction::Downstream);
    vad.handle(chunk_10ms(8000), Direction::Downstream);
    REQUIRE_FALSE(vad.speaking());

    vad.handle(chunk_10ms(8000), Direction::Downstream);
    vad.handle(chunk_10ms(8000), Direction::Downstream);
    REQUIRE(vad.speaking());
    vad.handle(chunk_10ms(0), Direction::Downstream);
    vad.handle(chunk_10ms(8000), Direction::Downstream);
    vad.handle(chunk_10ms(0), Direction::Downstream);
    REQUIRE(vad.speaking());
}

TEST_CASE("non-audio frames pass the detector untouched") {
    auto vad = make_detector();
    const auto out = vad.handle(TextChunk{"hello"}, Direction::Downstream);
    REQUIRE(out.size() == 1);
    REQUIRE(std::get<TextChunk>(out[0].frame).text == "hello");
}

TEST_CASE("the audio logger counts chunks and bytes and forwards everything") {
    stages::AudioReceptionLogger logger(2);
    for (int i = 0; i < 5; ++i) {
        const auto out = logger.handle(chunk_10ms(100), Direction::Downstream);
        REQUIRE(out.size() == 1);
    }
    logger.handle(TextChunk{"ignored"}, Direction::Downstream);
    REQUIRE(logger.chunk_count() == 5);
    REQUIRE(logger.total_bytes() == 5 * 320);
}
