#pragma once

#include <cstdint>
#include <string>

#include "order_voice/pipeline/stage.hpp"

namespace order_voice {
namespace stages {

// Logs inbound audio on the 1st, (N+1)th, (2N+1)th ... chunk.
class AudioReceptionLogger : public Stage {
public:
    explicit AudioReceptionLogger(int log_every);

    std::string name() const override { return "audio_logger"; }
    Emissions handle(const Frame& frame, Direction direction) override;

    uint64_t chunk_count() const { return chunks_; }
    uint64_t total_bytes() const { return bytes_; }

private:
    uint64_t log_every_;
    uint64_t chunks_ = 0;
    uint64_t bytes_ = 0;
};

}
}
