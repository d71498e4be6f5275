#include "order_voice/stages/voice_activity.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/utils/audio.hpp"

namespace order_voice {
namespace stages {

VoiceActivityStage::VoiceActivityStage(VoiceActivityOptions options)
    : options_(options) {}

Emissions VoiceActivityStage::handle(const Frame& frame, Direction direction) {
    const auto* chunk = std::get_if<AudioChunk>(&frame);
    if (!chunk || direction != Direction::Downstream || chunk->bytes.empty()) {
        return forward(frame, direction);
    }

    const double volume = utils::pcm_rms(chunk->bytes);
    const double duration_ms =
        utils::pcm_duration_ms(chunk->bytes.size(), chunk->sample_rate, chunk->channels);
    const bool loud = volume >= options_.min_volume;

    if (!speaking_) {
        voiced_ms_ = loud ? voiced_ms_ + duration_ms : 0.0;
        if (loud && voiced_ms_ >= options_.start_ms) {
            speaking_ = true;
            silent_ms_ = 0.0;
            logging::debug("User started speaking", {kv("volume", volume)});
            return {{LifecycleEvent{LifecycleKind::UserStarted}, Direction::Downstream},
                    {frame, direction}};
        }
        return forward(frame, direction);
    }

    silent_ms_ = loud ? 0.0 : silent_ms_ + duration_ms;
    if (!loud && silent_ms_ >= options_.stop_ms) {
        speaking_ = false;
        voiced_ms_ = 0.0;
        logging::debug("User stopped speaking", {kv("silent_ms", silent_ms_)});
        return {{frame, direction},
                {LifecycleEvent{LifecycleKind::UserStopped}, Direction::Downstream}};
    }
    return forward(frame, direction);
}

}
}
