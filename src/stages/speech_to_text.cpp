#include "order_voice/stages/speech_to_text.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/transport/frame_codec.hpp"
#include "order_voice/utils/audio.hpp"
#include "order_voice/utils/text.hpp"

namespace order_voice {
namespace stages {

namespace {

double chunk_ms(const AudioChunk& chunk) {
    return utils::pcm_duration_ms(chunk.bytes.size(), chunk.sample_rate, chunk.channels);
}

}

SpeechToTextStage::SpeechToTextStage(std::shared_ptr<SpeechToText> stt,
                                     int pre_roll_ms,
                                     int max_utterance_ms)
    : stt_(std::move(stt)),
      pre_roll_ms_(pre_roll_ms > 0 ? pre_roll_ms : 0),
      max_utterance_ms_(max_utterance_ms > 0 ? max_utterance_ms : 0),
      executor_("speech_to_text") {}

Emissions SpeechToTextStage::handle(const Frame& frame, Direction direction) {
    if (direction != Direction::Downstream) {
        return forward(frame, direction);
    }

    if (const auto* chunk = std::get_if<AudioChunk>(&frame)) {
        if (capturing_ &&
            (chunk->sample_rate != sample_rate_ || chunk->channels != channels_)) {
            // One WAV per format.
            submit_utterance();
        }
        sample_rate_ = chunk->sample_rate;
        channels_ = chunk->channels;
        if (capturing_) {
            utterance_.insert(utterance_.end(), chunk->bytes.begin(), chunk->bytes.end());
            if (max_utterance_ms_ > 0 &&
                utils::pcm_duration_ms(utterance_.size(), sample_rate_, channels_) >=
                    max_utterance_ms_) {
                logging::warn("Utterance reached maximum length, transcribing early",
                              {kv("max_ms", max_utterance_ms_)});
                submit_utterance();
            }
        } else {
            remember_pre_roll(*chunk);
        }
    } else if (is_lifecycle(frame, LifecycleKind::UserStarted)) {
        capturing_ = true;
        utterance_.clear();
        for (const auto& buffered : pre_roll_) {
            utterance_.insert(utterance_.end(), buffered.bytes.begin(), buffered.bytes.end());
        }
        pre_roll_.clear();
        pre_roll_buffered_ms_ = 0.0;
    } else if (is_lifecycle(frame, LifecycleKind::UserStopped) && capturing_) {
        capturing_ = false;
        submit_utterance();
    }
    return forward(frame, direction);
}

void SpeechToTextStage::stop() {
    executor_.shutdown();
}

void SpeechToTextStage::remember_pre_roll(const AudioChunk& chunk) {
    if (pre_roll_ms_ <= 0.0) {
        return;
    }
    pre_roll_.push_back(chunk);
    pre_roll_buffered_ms_ += chunk_ms(chunk);
    while (pre_roll_.size() > 1 &&
           pre_roll_buffered_ms_ - chunk_ms(pre_roll_.front()) >= pre_roll_ms_) {
        pre_roll_buffered_ms_ -= chunk_ms(pre_roll_.front());
        pre_roll_.pop_front();
    }
}

void SpeechToTextStage::submit_utterance() {
    if (utterance_.empty()) {
        return;
    }
    const auto duration_ms = utils::pcm_duration_ms(utterance_.size(), sample_rate_, channels_);
    auto wav = utils::encode_wav(utterance_, sample_rate_, channels_);
    utterance_.clear();

    logging::debug("Submitting utterance for transcription", {kv("duration_ms", duration_ms)});
    auto stt = stt_;
    auto emitter = this->emitter();
    executor_.post([stt, emitter, wav = std::move(wav)]() {
        try {
            const auto text = utils::trim(stt->transcribe(wav));
            if (text.empty()) {
                logging::debug("Empty transcription dropped");
                return;
            }
            logging::info("Speech transcribed", {kv("chars", text.size())});
            emitter.emit(TextChunk{text}, Direction::Downstream);
        } catch (const std::exception& ex) {
            logging::error("Transcription failed", {kv("error", ex.what())});
            emitter.emit(transport::make_error_message(
                             "Sorry, I could not understand the audio. Please try again."),
                         Direction::Downstream);
        }
    });
}

}
}
