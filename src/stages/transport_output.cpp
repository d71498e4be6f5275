#include "order_voice/stages/transport_output.hpp"

#include "order_voice/transport/frame_codec.hpp"

namespace order_voice {
namespace stages {

TransportOutput::TransportOutput(SendFn send)
    : send_(std::move(send)) {}

Emissions TransportOutput::handle(const Frame& frame, Direction direction) {
    if (direction == Direction::Downstream && send_) {
        if (const auto* chunk = std::get_if<AudioChunk>(&frame)) {
            send_(transport::encode_audio(*chunk));
        } else if (const auto* message = std::get_if<TransportMessage>(&frame)) {
            send_(transport::encode_message(*message));
        }
    }
    return forward(frame, direction);
}

}
}
