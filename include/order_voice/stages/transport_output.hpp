#pragma once

#include <functional>
#include <string>

#include "order_voice/pipeline/stage.hpp"

namespace order_voice {
namespace stages {

// Serializes outbound audio and transport messages to the session client.
class TransportOutput : public Stage {
public:
    // May throw when the client is gone; that ends the session.
    using SendFn = std::function<void(const std::string& payload)>;

    explicit TransportOutput(SendFn send);

    std::string name() const override { return "transport_output"; }
    Emissions handle(const Frame& frame, Direction direction) override;

private:
    SendFn send_;
};

}
}
