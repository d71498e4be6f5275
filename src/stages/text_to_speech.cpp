#include "order_voice/stages/text_to_speech.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/transport/frame_codec.hpp"
#include "order_voice/utils/audio.hpp"
#include "order_voice/utils/text.hpp"

namespace order_voice {
namespace stages {

namespace {

void emit_both_ways(const FrameEmitter& emitter, LifecycleKind kind) {
    emitter.emit(LifecycleEvent{kind}, Direction::Upstream);
    emitter.emit(LifecycleEvent{kind}, Direction::Downstream);
}

}

TextToSpeechStage::TextToSpeechStage(std::shared_ptr<TextToSpeech> tts, int max_inflight)
    : tts_(std::move(tts)),
      max_inflight_(max_inflight) {}

TextToSpeechStage::~TextToSpeechStage() {
    if (queue_) {
        queue_->cancel();
    }
}

Emissions TextToSpeechStage::handle(const Frame& frame, Direction direction) {
    if (direction != Direction::Downstream) {
        return forward(frame, direction);
    }

    if (const auto* chunk = std::get_if<TextChunk>(&frame)) {
        const auto text = utils::trim(utils::remove_emojis(chunk->text));
        if (!text.empty()) {
            queue().enqueue(text);
        }
        return forward(frame, direction);
    }

    if (is_lifecycle(frame, LifecycleKind::ResponseEnded)) {
        // Emitted through the queue so it follows this response's audio.
        queue().mark_end_of_response();
        return {};
    }

    return forward(frame, direction);
}

void TextToSpeechStage::stop() {
    if (queue_) {
        queue_->cancel();
    }
}

SynthesisQueue& TextToSpeechStage::queue() {
    if (queue_) {
        return *queue_;
    }

    auto tts = tts_;
    auto emitter = this->emitter();
    auto synth = [tts, emitter](const std::string& text) -> std::optional<AudioChunk> {
        try {
            const auto audio = utils::decode_wav(tts->synthesize(text));
            AudioChunk chunk{audio.bytes, audio.sample_rate, audio.channels};
            return chunk;
        } catch (const utils::WavFormatError& ex) {
            logging::error("Synthesized audio is not usable", {kv("error", ex.what())});
        } catch (const std::exception& ex) {
            logging::error("Speech synthesis failed", {kv("error", ex.what())});
        }
        emitter.emit(transport::make_error_message("Sorry, I could not speak the response."),
                     Direction::Downstream);
        return std::nullopt;
    };

    auto speaking = std::make_shared<Speaking>();
    auto deliver = [emitter, speaking](const SynthesisQueue::Delivery& delivery) {
        if (delivery.end_of_response) {
            speaking->active = false;
            emit_both_ways(emitter, LifecycleKind::BotStopped);
            return;
        }
        if (!delivery.audio || delivery.audio->bytes.empty()) {
            return;
        }
        if (!speaking->active) {
            speaking->active = true;
            emit_both_ways(emitter, LifecycleKind::BotStarted);
        }
        logging::debug("Synthesized audio ready",
                       {kv("text", delivery.text), kv("bytes", delivery.audio->bytes.size())});
        emitter.emit(*delivery.audio, Direction::Downstream);
    };

    queue_ = SynthesisQueue::create(max_inflight_, std::move(synth), std::move(deliver));
    return *queue_;
}

}
}
