#include "order_voice/session/voice_session.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/metrics.hpp"
#include "order_voice/stages/audio_logger.hpp"
#include "order_voice/stages/chat_completion.hpp"
#include "order_voice/stages/order_knowledge.hpp"
#include "order_voice/stages/speech_to_text.hpp"
#include "order_voice/stages/state_tracker.hpp"
#include "order_voice/stages/text_to_speech.hpp"
#include "order_voice/stages/transcript_recorder.hpp"
#include "order_voice/stages/voice_activity.hpp"
#include "order_voice/transport/frame_codec.hpp"

namespace order_voice {

namespace {

// Audio kept ahead of the detector's onset, beyond the onset window itself.
constexpr int kPreRollPaddingMs = 200;

}

VoiceSession::VoiceSession(std::string id,
                           const Config& config,
                           SpeechServices services,
                           const OrderStore& store,
                           TranscriptHub& hub,
                           SendFn send)
    : id_(std::move(id)),
      default_sample_rate_(config.audio_in_sample_rate) {
    const auto& prompt = config.system_prompt.empty() ? std::string(kDefaultSystemPrompt)
                                                      : config.system_prompt;
    context_ = std::make_shared<LlmContext>(std::vector<ChatMessage>{{"system", prompt}});

    stages::VoiceActivityOptions vad;
    vad.min_volume = config.vad_min_volume;
    vad.start_ms = config.vad_start_ms;
    vad.stop_ms = config.vad_stop_ms;

    std::vector<std::shared_ptr<Stage>> chain{
        std::make_shared<stages::VoiceActivityStage>(vad),
        std::make_shared<stages::AudioReceptionLogger>(config.audio_log_every),
        std::make_shared<stages::ConversationStateTracker>(),
        std::make_shared<stages::SpeechToTextStage>(services.stt,
                                                    config.vad_start_ms + kPreRollPaddingMs,
                                                    config.max_utterance_ms),
        std::make_shared<stages::OrderKnowledgeInjector>(store, *context_),
        std::make_shared<stages::TranscriptRecorder>(Speaker::User, hub),
        std::make_shared<stages::ChatCompletionStage>(services.llm, context_),
        std::make_shared<stages::TranscriptRecorder>(Speaker::Bot, hub),
        std::make_shared<stages::TextToSpeechStage>(services.tts, config.tts_max_inflight),
        std::make_shared<stages::TransportOutput>(std::move(send)),
    };
    pipeline_ = std::make_unique<Pipeline>(std::move(chain));
}

VoiceSession::~VoiceSession() {
    close();
}

void VoiceSession::start(TerminatedHandler on_terminated) {
    if (started_.exchange(true)) {
        return;
    }
    Metrics::instance().session_started();
    logging::info("Voice session started", {kv("session_id", id_)});
    const auto id = id_;
    pipeline_->start(nullptr, [id, on_terminated](const PipelineTerminated& error) {
        logging::error("Voice session pipeline failed",
                       {kv("session_id", id), kv("stage", error.stage())});
        if (on_terminated) {
            on_terminated(error.what());
        }
    });
    pipeline_->push(LifecycleEvent{LifecycleKind::SessionStart});
}

void VoiceSession::receive(const std::string& payload) {
    if (closed_.load()) {
        return;
    }
    auto frame = transport::decode_client_message(payload, default_sample_rate_);
    if (frame) {
        pipeline_->push(std::move(*frame));
    }
}

void VoiceSession::close() {
    if (closed_.exchange(true)) {
        return;
    }
    pipeline_->stop();
    if (started_.load()) {
        Metrics::instance().session_finished();
    }
    logging::info("Voice session closed",
                  {kv("session_id", id_), kv("context_messages", context_->size())});
}

}
