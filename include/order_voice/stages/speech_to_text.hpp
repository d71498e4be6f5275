#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "order_voice/backend/speech_services.hpp"
#include "order_voice/pipeline/stage.hpp"
#include "order_voice/utils/async.hpp"

namespace order_voice {
namespace stages {

// Collects the audio of one user turn and transcribes it off the pipeline
// thread. The transcript enters the pipeline as a Downstream TextChunk.
// A short pre-roll of audio heard before UserStarted is kept so the start
// of the utterance survives the detector's onset delay. A turn longer than
// max_utterance_ms is transcribed in pieces while capture continues.
class SpeechToTextStage : public Stage {
public:
    SpeechToTextStage(std::shared_ptr<SpeechToText> stt, int pre_roll_ms, int max_utterance_ms);

    std::string name() const override { return "speech_to_text"; }
    Emissions handle(const Frame& frame, Direction direction) override;
    void stop() override;

    bool capturing() const { return capturing_; }
    // Blocks until queued transcriptions have finished.
    void wait_idle() { executor_.wait_idle(); }

private:
    void remember_pre_roll(const AudioChunk& chunk);
    void submit_utterance();

    std::shared_ptr<SpeechToText> stt_;
    double pre_roll_ms_;
    int max_utterance_ms_;
    bool capturing_ = false;
    std::deque<AudioChunk> pre_roll_;
    double pre_roll_buffered_ms_ = 0.0;
    std::vector<uint8_t> utterance_;
    int sample_rate_ = 16000;
    int channels_ = 1;
    utils::SerialExecutor executor_;
};

}
}
