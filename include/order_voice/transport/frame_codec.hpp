#pragma once

#include <optional>
#include <string>

#include "order_voice/pipeline/frame.hpp"

namespace order_voice {
namespace transport {

// Converts one inbound text message into a frame. Returns nullopt for
// malformed JSON, client "message" payloads and unknown types.
std::optional<Frame> decode_client_message(const std::string& payload,
                                           int default_sample_rate);

// {"type":"audio","data":<base64>,"sample_rate":n,"channels":n}
std::string encode_audio(const AudioChunk& chunk);

// {"type":"message","data":<payload>}; payloads that are JSON documents are
// embedded as such, anything else as a string.
std::string encode_message(const TransportMessage& message);

TransportMessage make_error_message(const std::string& message);

}
}
