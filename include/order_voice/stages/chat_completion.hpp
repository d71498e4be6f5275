#pragma once

#include <memory>
#include <string>

#include "order_voice/backend/speech_services.hpp"
#include "order_voice/llm/context.hpp"
#include "order_voice/pipeline/stage.hpp"
#include "order_voice/utils/async.hpp"

namespace order_voice {
namespace stages {

// Turns each user utterance into an assistant reply. The utterance is added
// to the context on the pipeline thread; the completion runs on a serial
// executor over a snapshot of the context. The reply is appended to the
// context and emitted as ResponseStarted, sentence TextChunks, ResponseEnded.
class ChatCompletionStage : public Stage {
public:
    ChatCompletionStage(std::shared_ptr<ChatModel> model, std::shared_ptr<LlmContext> context);

    std::string name() const override { return "chat_completion"; }
    Emissions handle(const Frame& frame, Direction direction) override;
    void stop() override;

    void wait_idle() { executor_.wait_idle(); }

private:
    std::shared_ptr<ChatModel> model_;
    std::shared_ptr<LlmContext> context_;
    utils::SerialExecutor executor_;
};

}
}
