#pragma once

#include <string>

#include "order_voice/pipeline/stage.hpp"

namespace order_voice {
namespace stages {

struct VoiceActivityOptions {
    double min_volume = 0.02; // RMS in [0, 1]
    int start_ms = 150;
    int stop_ms = 150;
};

// Energy based speech detector. Emits UserStarted ahead of the chunk that
// completes `start_ms` of loud audio and UserStopped after the chunk that
// completes `stop_ms` of quiet audio. Audio is always forwarded.
class VoiceActivityStage : public Stage {
public:
    explicit VoiceActivityStage(VoiceActivityOptions options);

    std::string name() const override { return "voice_activity"; }
    Emissions handle(const Frame& frame, Direction direction) override;

    bool speaking() const { return speaking_; }

private:
    VoiceActivityOptions options_;
    bool speaking_ = false;
    double voiced_ms_ = 0.0;
    double silent_ms_ = 0.0;
};

}
}
