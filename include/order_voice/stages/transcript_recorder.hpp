#pragma once

#include <string>

#include "order_voice/pipeline/stage.hpp"
#include "order_voice/transcript/hub.hpp"

namespace order_voice {
namespace stages {

// Records one speaker's utterances into the transcript hub. User text
// frames are whole utterances and are recorded at once, followed by a
// transcript snapshot for the session client. Bot text streams in pieces
// and is recorded as one utterance when the bot stops speaking.
class TranscriptRecorder : public Stage {
public:
    TranscriptRecorder(Speaker speaker, TranscriptHub& hub);

    std::string name() const override;
    Emissions handle(const Frame& frame, Direction direction) override;

    const std::string& pending_text() const { return bot_buffer_; }

private:
    Speaker speaker_;
    TranscriptHub& hub_;
    std::string bot_buffer_;
};

}
}
