#include "order_voice/stages/transcript_recorder.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/utils/text.hpp"

namespace order_voice {
namespace stages {

TranscriptRecorder::TranscriptRecorder(Speaker speaker, TranscriptHub& hub)
    : speaker_(speaker),
      hub_(hub) {}

std::string TranscriptRecorder::name() const {
    return std::string("transcript_") + to_string(speaker_);
}

Emissions TranscriptRecorder::handle(const Frame& frame, Direction direction) {
    Emissions out;
    if (const auto* chunk = std::get_if<TextChunk>(&frame);
        chunk && direction == Direction::Downstream) {
        if (speaker_ == Speaker::Bot) {
            bot_buffer_ += chunk->text;
        } else {
            hub_.add_message(Speaker::User, chunk->text);
            out.push_back({TransportMessage{hub_.snapshot()}, Direction::Downstream});
        }
    }

    if (speaker_ == Speaker::Bot && is_lifecycle(frame, LifecycleKind::BotStopped)) {
        const auto text = utils::trim(bot_buffer_);
        bot_buffer_.clear();
        if (!text.empty()) {
            hub_.add_message(Speaker::Bot, text);
            logging::debug("Bot utterance recorded", {kv("chars", text.size())});
        }
    }

    out.push_back({frame, direction});
    return out;
}

}
}
