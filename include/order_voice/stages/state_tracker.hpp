#pragma once

#include <optional>
#include <string>

#include "order_voice/pipeline/stage.hpp"

namespace order_voice {
namespace stages {

enum class ConversationState {
    Listening,
    Processing,
    Responding
};

const char* to_string(ConversationState state);

// Turns talk/listen lifecycle frames into {"type":"state"} client messages,
// one per actual state change.
class ConversationStateTracker : public Stage {
public:
    std::string name() const override { return "conversation_state"; }
    Emissions handle(const Frame& frame, Direction direction) override;

    std::optional<TransportMessage> observe(const Frame& frame, Direction direction);
    std::optional<ConversationState> state() const { return state_; }

private:
    std::optional<ConversationState> state_;
};

}
}
