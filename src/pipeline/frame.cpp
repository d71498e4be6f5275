#include "order_voice/pipeline/frame.hpp"

namespace order_voice {

const char* to_string(Direction direction) {
    return direction == Direction::Downstream ? "downstream" : "upstream";
}

const char* to_string(LifecycleKind kind) {
    switch (kind) {
        case LifecycleKind::SessionStart:
            return "session_start";
        case LifecycleKind::UserStarted:
            return "user_started";
        case LifecycleKind::UserStopped:
            return "user_stopped";
        case LifecycleKind::BotStarted:
            return "bot_started";
        case LifecycleKind::BotStopped:
            return "bot_stopped";
        case LifecycleKind::ResponseStarted:
            return "response_started";
        case LifecycleKind::ResponseEnded:
            return "response_ended";
    }
    return "unknown";
}

const char* frame_kind(const Frame& frame) {
    switch (frame.index()) {
        case 0:
            return "audio";
        case 1:
            return "text";
        case 2:
            return "lifecycle";
        case 3:
            return "transport_message";
        default:
            return "unknown";
    }
}

}
