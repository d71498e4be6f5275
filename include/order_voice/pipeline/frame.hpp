#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace order_voice {

enum class Direction {
    Downstream,
    Upstream
};

struct AudioChunk {
    std::vector<uint8_t> bytes; // 16-bit little-endian PCM.
    int sample_rate = 16000;
    int channels = 1;
};

struct TextChunk {
    std::string text;
};

enum class LifecycleKind {
    SessionStart,
    UserStarted,
    UserStopped,
    BotStarted,
    BotStopped,
    ResponseStarted,
    ResponseEnded
};

struct LifecycleEvent {
    LifecycleKind kind;
};

// Outbound message for the session client; payload is a serialized JSON document.
struct TransportMessage {
    std::string json_payload;
};

using Frame = std::variant<AudioChunk, TextChunk, LifecycleEvent, TransportMessage>;

struct Emission {
    Frame frame;
    Direction direction;
};

using Emissions = std::vector<Emission>;

const char* to_string(Direction direction);
const char* to_string(LifecycleKind kind);
const char* frame_kind(const Frame& frame);

inline bool is_lifecycle(const Frame& frame, LifecycleKind kind) {
    const auto* event = std::get_if<LifecycleEvent>(&frame);
    return event && event->kind == kind;
}

}
