#pragma once

#include <memory>
#include <string>

#include "order_voice/backend/speech_services.hpp"
#include "order_voice/pipeline/stage.hpp"
#include "order_voice/stages/synthesis_queue.hpp"

namespace order_voice {
namespace stages {

// Speaks the reply text. Audio leaves Downstream in sentence order. The
// first audio of a response is preceded by BotStarted and the end of the
// response produces BotStopped; both are sent Upstream and Downstream so
// stages before and after this one observe them.
class TextToSpeechStage : public Stage {
public:
    TextToSpeechStage(std::shared_ptr<TextToSpeech> tts, int max_inflight);
    ~TextToSpeechStage() override;

    std::string name() const override { return "text_to_speech"; }
    Emissions handle(const Frame& frame, Direction direction) override;
    void stop() override;

private:
    struct Speaking {
        bool active = false;
    };

    SynthesisQueue& queue();

    std::shared_ptr<TextToSpeech> tts_;
    int max_inflight_;
    std::shared_ptr<SynthesisQueue> queue_;
};

}
}
