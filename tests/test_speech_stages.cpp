#include <catch2/catch_test_macros.hpp>

#include "order_voice/session/voice_session.hpp"
#include "order_voice/stages/chat_completion.hpp"
#include "order_voice/stages/speech_to_text.hpp"
#include "order_voice/stages/text_to_speech.hpp"
#include "order_voice/utils/audio.hpp"
#include "order_voice/utils/text.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace order_voice;

namespace {

class FakeSpeechToText : public SpeechToText {
public:
    explicit FakeSpeechToText(std::string reply) : reply_(std::move(reply)) {}

    std::string transcribe(const std::string& wav) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_wav = wav;
        wavs.push_back(wav);
        ++calls;
        if (fail) {
            throw BackendError("transcription service unavailable");
        }
        if (fail_unexpectedly) {
            throw std::runtime_error("malformed transcription payload");
        }
        return reply_;
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return wavs;
    }

    std::string last_wav;
    std::vector<std::string> wavs;
    std::atomic<int> calls{0};
    bool fail = false;
    bool fail_unexpectedly = false;

private:
    std::mutex mutex_;
    std::string reply_;
};

class FakeChatModel : public ChatModel {
public:
    explicit FakeChatModel(std::string reply) : reply_(std::move(reply)) {}

    std::string complete(const std::vector<ChatMessage>& messages) override {
        seen = messages;
        if (fail) {
            throw BackendError("completion service unavailable");
        }
        if (fail_unexpectedly) {
            throw std::out_of_range("choices");
        }
        return reply_;
    }

    std::vector<ChatMessage> seen;
    bool fail = false;
    bool fail_unexpectedly = false;

private:
    std::string reply_;
};

// Produces one 16-bit sample per character; the first sentence is the slowest.
class FakeTextToSpeech : public TextToSpeech {
public:
    std::string synthesize(const std::string& text) override {
        if (fail_unexpectedly) {
            throw std::runtime_error("speech payload truncated");
        }
        if (++calls == 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        std::vector<uint8_t> pcm(text.size() * 2, 0x01);
        return utils::encode_wav(pcm, 24000, 1);
    }

    std::atomic<int> calls{0};
    bool fail_unexpectedly = false;
};

class FrameLog {
public:
    Pipeline::Sink sink() {
        return [this](const Frame& frame, Direction direction) {
            std::lock_guard<std::mutex> lock(mutex_);
            frames_.push_back({frame, direction});
            cv_.notify_all();
        };
    }

    bool wait_until(const std::function<bool(const std::vector<Emission>&)>& ready) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [&]() { return ready(frames_); });
    }

    std::vector<Emission> frames() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Emission> frames_;
};

bool has_lifecycle(const std::vector<Emission>& frames, LifecycleKind kind, Direction direction) {
    for (const auto& emission : frames) {
        if (is_lifecycle(emission.frame, kind) && emission.direction == direction) {
            return true;
        }
    }
    return false;
}

AudioChunk loud_chunk(std::size_t samples) {
    AudioChunk chunk;
    chunk.bytes.assign(samples * 2, 0x20);
    return chunk;
}

}

TEST_CASE("one user turn is transcribed into a single text frame") {
    auto stt = std::make_shared<FakeSpeechToText>("  order number is 1003 ");
    auto stage = std::make_shared<stages::SpeechToTextStage>(stt, 0, 30000);
    FrameLog log;
    Pipeline pipeline({stage});
    pipeline.start(log.sink());

    pipeline.push(loud_chunk(80)); // before the turn, dropped without pre-roll
    pipeline.push(LifecycleEvent{LifecycleKind::UserStarted});
    pipeline.push(loud_chunk(160));
    pipeline.push(loud_chunk(160));
    pipeline.push(LifecycleEvent{LifecycleKind::UserStopped});

    REQUIRE(log.wait_until([](const std::vector<Emission>& frames) {
        for (const auto& emission : frames) {
            if (std::holds_alternative<TextChunk>(emission.frame)) {
                return true;
            }
        }
        return false;
    }));
    stage->wait_idle();
    pipeline.stop();

    REQUIRE(stt->calls == 1);
    const auto audio = utils::decode_wav(stt->last_wav);
    REQUIRE(audio.bytes.size() == 640);
    REQUIRE(audio.sample_rate == 16000);

    std::vector<std::string> texts;
    for (const auto& emission : log.frames()) {
        if (const auto* chunk = std::get_if<TextChunk>(&emission.frame)) {
            texts.push_back(chunk->text);
        }
    }
    REQUIRE(texts == std::vector<std::string>{"order number is 1003"});
}

TEST_CASE("audio heard just before the turn starts is kept") {
    auto stt = std::make_shared<FakeSpeechToText>("hello");
    stages::SpeechToTextStage stage(stt, 10, 30000);
    stage.handle(loud_chunk(160), Direction::Downstream);
    stage.handle(loud_chunk(160), Direction::Downstream);
    stage.handle(LifecycleEvent{LifecycleKind::UserStarted}, Direction::Downstream);
    REQUIRE(stage.capturing());
    stage.handle(loud_chunk(160), Direction::Downstream);
    stage.handle(LifecycleEvent{LifecycleKind::UserStopped}, Direction::Downstream);
    stage.wait_idle();

    // One 10 ms chunk of pre-roll plus the turn itself.
    REQUIRE(utils::decode_wav(stt->last_wav).bytes.size() == 640);
}

TEST_CASE("transcription failures reach the client as an error message") {
    auto stt = std::make_shared<FakeSpeechToText>("unused");
    stt->fail = true;
    auto stage = std::make_shared<stages::SpeechToTextStage>(stt, 0, 30000);
    FrameLog log;
    Pipeline pipeline({stage});
    pipeline.start(log.sink());
    pipeline.push(LifecycleEvent{LifecycleKind::UserStarted});
    pipeline.push(loud_chunk(160));
    pipeline.push(LifecycleEvent{LifecycleKind::UserStopped});

    REQUIRE(log.wait_until([](const std::vector<Emission>& frames) {
        for (const auto& emission : frames) {
            if (std::holds_alternative<TransportMessage>(emission.frame)) {
                return true;
            }
        }
        return false;
    }));
    pipeline.stop();
    REQUIRE_FALSE(pipeline.terminated());

    for (const auto& emission : log.frames()) {
        if (const auto* message = std::get_if<TransportMessage>(&emission.frame)) {
            REQUIRE(nlohmann::json::parse(message->json_payload)["type"] == "error");
        }
    }
}

TEST_CASE("a user utterance becomes a sentence-split assistant reply") {
    auto model = std::make_shared<FakeChatModel>("Order 1003 has shipped. It arrives Friday.");
    auto context = std::make_shared<LlmContext>(std::vector<ChatMessage>{{"system", "be brief"}});
    auto stage = std::make_shared<stages::ChatCompletionStage>(model, context);
    FrameLog log;
    Pipeline pipeline({stage});
    pipeline.start(log.sink());
    pipeline.push(TextChunk{"where is order 1003"});

    REQUIRE(log.wait_until([](const std::vector<Emission>& frames) {
        return has_lifecycle(frames, LifecycleKind::ResponseEnded, Direction::Downstream);
    }));
    pipeline.stop();

    const auto frames = log.frames();
    REQUIRE(frames.size() == 4);
    REQUIRE(is_lifecycle(frames[0].frame, LifecycleKind::ResponseStarted));
    REQUIRE(std::get<TextChunk>(frames[1].frame).text == "Order 1003 has shipped. ");
    REQUIRE(std::get<TextChunk>(frames[2].frame).text == "It arrives Friday.");
    REQUIRE(is_lifecycle(frames[3].frame, LifecycleKind::ResponseEnded));

    REQUIRE(model->seen.size() == 2);
    REQUIRE(model->seen[1].role == "user");
    const auto history = context->messages();
    REQUIRE(history.size() == 3);
    REQUIRE(history[2].role == "assistant");
    REQUIRE(history[2].content == "Order 1003 has shipped. It arrives Friday.");
}

TEST_CASE("completion failures leave the context without a reply") {
    auto model = std::make_shared<FakeChatModel>("unused");
    model->fail = true;
    auto context = std::make_shared<LlmContext>();
    auto stage = std::make_shared<stages::ChatCompletionStage>(model, context);
    FrameLog log;
    Pipeline pipeline({stage});
    pipeline.start(log.sink());
    pipeline.push(TextChunk{"hello"});

    REQUIRE(log.wait_until([](const std::vector<Emission>& frames) { return !frames.empty(); }));
    pipeline.stop();
    REQUIRE(std::holds_alternative<TransportMessage>(log.frames()[0].frame));
    REQUIRE(context->size() == 1);
}

TEST_CASE("speech is delivered in sentence order between bot start and stop") {
    auto tts = std::make_shared<FakeTextToSpeech>();
    auto stage = std::make_shared<stages::TextToSpeechStage>(tts, 3);
    FrameLog log;
    Pipeline pipeline({stage});
    pipeline.start(log.sink());

    pipeline.push(LifecycleEvent{LifecycleKind::ResponseStarted});
    pipeline.push(TextChunk{"First sentence here. "});
    pipeline.push(TextChunk{"Second. "});
    pipeline.push(TextChunk{"Third \xF0\x9F\x98\x80 one."});
    pipeline.push(LifecycleEvent{LifecycleKind::ResponseEnded});

    REQUIRE(log.wait_until([](const std::vector<Emission>& frames) {
        return has_lifecycle(frames, LifecycleKind::BotStopped, Direction::Downstream);
    }));
    pipeline.stop();

    std::vector<std::size_t> audio_sizes;
    std::vector<std::string> order;
    for (const auto& emission : log.frames()) {
        if (emission.direction == Direction::Upstream) {
            continue;
        }
        if (const auto* chunk = std::get_if<AudioChunk>(&emission.frame)) {
            audio_sizes.push_back(chunk->bytes.size());
            REQUIRE(chunk->sample_rate == 24000);
            order.push_back("audio");
        } else if (is_lifecycle(emission.frame, LifecycleKind::BotStarted)) {
            order.push_back("started");
        } else if (is_lifecycle(emission.frame, LifecycleKind::BotStopped)) {
            order.push_back("stopped");
        }
    }
    REQUIRE(audio_sizes ==
            std::vector<std::size_t>{std::string("First sentence here.").size() * 2,
                                     std::string("Second.").size() * 2,
                                     std::string("Third  one.").size() * 2});
    REQUIRE(order == std::vector<std::string>{"started", "audio", "audio", "audio", "stopped"});

    const auto frames = log.frames();
    REQUIRE(has_lifecycle(frames, LifecycleKind::BotStarted, Direction::Upstream));
    REQUIRE(has_lifecycle(frames, LifecycleKind::BotStopped, Direction::Upstream));
    REQUIRE_FALSE(has_lifecycle(frames, LifecycleKind::ResponseEnded, Direction::Downstream));
}

TEST_CASE("a voice session answers an order question end to end") {
    Config config;
    config.groq_api_key = "test-key";
    config.vad_start_ms = 20;
    config.vad_stop_ms = 20;
    config.audio_log_every = 100;

    const auto store = OrderStore::from_json(nlohmann::json::parse(R"({
      "products": [{"id": 1, "name": "Wireless Headphones", "price": 89.99, "sku": "WH-1000"}],
      "orders": [{"id": 1003, "customer_id": 13, "order_date": "2024-03-08T11:05:00",
                  "total_amount": 89.99, "status": "shipped"}],
      "order_items": [{"order_id": 1003, "product_id": 1, "quantity": 1, "unit_price": 89.99}]
    })"));
    TranscriptHub hub;

    auto stt = std::make_shared<FakeSpeechToText>("order number is 1003");
    auto llm = std::make_shared<FakeChatModel>("Order 1003 has shipped. Anything else?");
    auto tts = std::make_shared<FakeTextToSpeech>();

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<nlohmann::json> sent;
    auto send = [&](const std::string& payload) {
        std::lock_guard<std::mutex> lock(mutex);
        sent.push_back(nlohmann::json::parse(payload));
        cv.notify_all();
    };

    VoiceSession session("voice-test", config, SpeechServices{stt, llm, tts}, store, hub, send);
    session.start();

    const std::string loud(640, '\x20');
    const std::string quiet(640, '\0');
    auto audio_message = [](const std::string& pcm) {
        return nlohmann::json{{"type", "audio"}, {"data", utils::encode_base64(pcm)}}.dump();
    };
    for (int i = 0; i < 3; ++i) {
        session.receive(audio_message(loud));
    }
    for (int i = 0; i < 3; ++i) {
        session.receive(audio_message(quiet));
    }

    auto states = [&]() {
        std::vector<std::string> values;
        for (const auto& message : sent) {
            if (message["type"] == "message" && message["data"].is_object() &&
                message["data"].value("type", "") == "state") {
                values.push_back(message["data"]["value"].get<std::string>());
            }
        }
        return values;
    };
    {
        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&]() {
            const auto values = states();
            return values.size() >= 4;
        }));
        REQUIRE(states() ==
                std::vector<std::string>{"listening", "processing", "responding", "listening"});
    }
    for (int i = 0; i < 100 && hub.entries().size() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    session.close();

    const auto entries = hub.entries();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].speaker == Speaker::User);
    REQUIRE(entries[0].text == "order number is 1003");
    REQUIRE(entries[1].speaker == Speaker::Bot);
    REQUIRE(entries[1].text == "Order 1003 has shipped. Anything else?");

    const auto history = session.context()->messages();
    REQUIRE(history.size() == 4);
    REQUIRE(history[0].role == "system");
    REQUIRE(history[1].role == "system");
    REQUIRE(history[1].content.find("- Status: shipped") != std::string::npos);
    REQUIRE(history[2].content == "order number is 1003");
    REQUIRE(history[3].role == "assistant");

    std::size_t audio_messages = 0;
    for (const auto& message : sent) {
        if (message["type"] == "audio") {
            ++audio_messages;
        }
    }
    REQUIRE(audio_messages == 2);
}

TEST_CASE("a turn that never goes quiet is transcribed in bounded pieces") {
    auto stt = std::make_shared<FakeSpeechToText>("still talking");
    stages::SpeechToTextStage stage(stt, 0, 100);
    stage.handle(LifecycleEvent{LifecycleKind::UserStarted}, Direction::Downstream);
    // 25 chunks of 10 ms at 16 kHz mono.
    for (int i = 0; i < 25; ++i) {
        stage.handle(loud_chunk(160), Direction::Downstream);
    }
    REQUIRE(stage.capturing());
    stage.wait_idle();

    auto wavs = stt->received();
    REQUIRE(wavs.size() == 2);
    for (const auto& wav : wavs) {
        REQUIRE(utils::decode_wav(wav).bytes.size() == 3200);
    }

    stage.handle(LifecycleEvent{LifecycleKind::UserStopped}, Direction::Downstream);
    stage.wait_idle();
    wavs = stt->received();
    REQUIRE(wavs.size() == 3);
    REQUIRE(utils::decode_wav(wavs.back()).bytes.size() == 1600);
}

TEST_CASE("a format change mid turn starts a new piece") {
    auto stt = std::make_shared<FakeSpeechToText>("hello");
    stages::SpeechToTextStage stage(stt, 0, 30000);
    stage.handle(LifecycleEvent{LifecycleKind::UserStarted}, Direction::Downstream);
    stage.handle(loud_chunk(160), Direction::Downstream);
    auto wide = loud_chunk(480);
    wide.sample_rate = 48000;
    stage.handle(wide, Direction::Downstream);
    stage.handle(LifecycleEvent{LifecycleKind::UserStopped}, Direction::Downstream);
    stage.wait_idle();

    const auto wavs = stt->received();
    REQUIRE(wavs.size() == 2);
    REQUIRE(utils::decode_wav(wavs[0]).sample_rate == 16000);
    REQUIRE(utils::decode_wav(wavs[1]).sample_rate == 48000);
}

namespace {

bool has_error_message(const std::vector<Emission>& frames) {
    for (const auto& emission : frames) {
        if (const auto* message = std::get_if<TransportMessage>(&emission.frame)) {
            if (nlohmann::json::parse(message->json_payload)["type"] == "error") {
                return true;
            }
        }
    }
    return false;
}

}

TEST_CASE("unexpected backend exceptions still reach the client as errors") {
    FrameLog log;

    SECTION("transcription") {
        auto stt = std::make_shared<FakeSpeechToText>("unused");
        stt->fail_unexpectedly = true;
        auto stage = std::make_shared<stages::SpeechToTextStage>(stt, 0, 30000);
        Pipeline pipeline({stage});
        pipeline.start(log.sink());
        pipeline.push(LifecycleEvent{LifecycleKind::UserStarted});
        pipeline.push(loud_chunk(160));
        pipeline.push(LifecycleEvent{LifecycleKind::UserStopped});
        REQUIRE(log.wait_until(has_error_message));
        pipeline.stop();
        REQUIRE_FALSE(pipeline.terminated());
    }

    SECTION("completion") {
        auto model = std::make_shared<FakeChatModel>("unused");
        model->fail_unexpectedly = true;
        auto stage = std::make_shared<stages::ChatCompletionStage>(
            model, std::make_shared<LlmContext>());
        Pipeline pipeline({stage});
        pipeline.start(log.sink());
        pipeline.push(TextChunk{"hello"});
        REQUIRE(log.wait_until(has_error_message));
        pipeline.stop();
        REQUIRE_FALSE(pipeline.terminated());
    }

    SECTION("synthesis") {
        auto tts = std::make_shared<FakeTextToSpeech>();
        tts->fail_unexpectedly = true;
        auto stage = std::make_shared<stages::TextToSpeechStage>(tts, 2);
        Pipeline pipeline({stage});
        pipeline.start(log.sink());
        pipeline.push(TextChunk{"Hello there."});
        pipeline.push(LifecycleEvent{LifecycleKind::ResponseEnded});
        REQUIRE(log.wait_until([](const std::vector<Emission>& frames) {
            return has_error_message(frames) &&
                   has_lifecycle(frames, LifecycleKind::BotStopped, Direction::Downstream);
        }));
        pipeline.stop();
        REQUIRE_FALSE(pipeline.terminated());
    }
}
