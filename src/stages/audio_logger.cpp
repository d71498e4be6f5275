#include "order_voice/stages/audio_logger.hpp"

#include <algorithm>

#include "order_voice/logging.hpp"

namespace order_voice {
namespace stages {

AudioReceptionLogger::AudioReceptionLogger(int log_every)
    : log_every_(static_cast<uint64_t>(std::max(1, log_every))) {}

Emissions AudioReceptionLogger::handle(const Frame& frame, Direction direction) {
    const auto* chunk = std::get_if<AudioChunk>(&frame);
    if (chunk && direction == Direction::Downstream) {
        ++chunks_;
        bytes_ += chunk->bytes.size();
        if ((chunks_ - 1) % log_every_ == 0) {
            logging::info("Audio received",
                          {kv("chunk", chunks_),
                           kv("bytes", chunk->bytes.size()),
                           kv("sample_rate", chunk->sample_rate),
                           kv("total_kb", static_cast<double>(bytes_) / 1024.0)});
        }
    }
    return forward(frame, direction);
}

}
}
