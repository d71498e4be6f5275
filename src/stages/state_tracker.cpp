#include "order_voice/stages/state_tracker.hpp"

#include <nlohmann/json.hpp>

#include "order_voice/logging.hpp"

namespace order_voice {
namespace stages {

namespace {

// User-side and session events count only on their way downstream; bot
// speech events are reported by the output side in both directions.
std::optional<ConversationState> map_event(LifecycleKind kind, Direction direction) {
    const bool downstream = direction == Direction::Downstream;
    switch (kind) {
        case LifecycleKind::SessionStart:
        case LifecycleKind::UserStarted:
            return downstream ? std::optional(ConversationState::Listening) : std::nullopt;
        case LifecycleKind::UserStopped:
            return downstream ? std::optional(ConversationState::Processing) : std::nullopt;
        case LifecycleKind::BotStarted:
            return ConversationState::Responding;
        case LifecycleKind::BotStopped:
            return ConversationState::Listening;
        default:
            return std::nullopt;
    }
}

}

const char* to_string(ConversationState state) {
    switch (state) {
        case ConversationState::Listening:
            return "listening";
        case ConversationState::Processing:
            return "processing";
        case ConversationState::Responding:
            return "responding";
    }
    return "unknown";
}

std::optional<TransportMessage> ConversationStateTracker::observe(const Frame& frame,
                                                                  Direction direction) {
    const auto* event = std::get_if<LifecycleEvent>(&frame);
    if (!event) {
        return std::nullopt;
    }
    const auto next = map_event(event->kind, direction);
    if (!next || state_ == next) {
        return std::nullopt;
    }
    state_ = next;
    logging::info("Conversation state changed",
                  {kv("state", to_string(*next)), kv("event", to_string(event->kind))});
    nlohmann::json payload{{"type", "state"}, {"value", to_string(*next)}};
    return TransportMessage{payload.dump()};
}

Emissions ConversationStateTracker::handle(const Frame& frame, Direction direction) {
    Emissions out;
    if (auto message = observe(frame, direction)) {
        out.push_back({std::move(*message), Direction::Downstream});
    }
    out.push_back({frame, direction});
    return out;
}

}
}
