#include "order_voice/stages/chat_completion.hpp"

#include "order_voice/logging.hpp"
#include "order_voice/transport/frame_codec.hpp"
#include "order_voice/utils/text.hpp"

namespace order_voice {
namespace stages {

ChatCompletionStage::ChatCompletionStage(std::shared_ptr<ChatModel> model,
                                         std::shared_ptr<LlmContext> context)
    : model_(std::move(model)),
      context_(std::move(context)),
      executor_("chat_completion") {}

Emissions ChatCompletionStage::handle(const Frame& frame, Direction direction) {
    const auto* chunk = std::get_if<TextChunk>(&frame);
    if (!chunk || direction != Direction::Downstream) {
        return forward(frame, direction);
    }

    const auto text = utils::trim(chunk->text);
    if (text.empty()) {
        return {};
    }
    context_->append_message("user", text);

    auto model = model_;
    auto context = context_;
    auto emitter = this->emitter();
    executor_.post([model, context, emitter]() {
        std::string reply;
        try {
            reply = utils::trim(model->complete(context->messages()));
        } catch (const std::exception& ex) {
            logging::error("Completion failed", {kv("error", ex.what())});
            emitter.emit(transport::make_error_message(
                             "Sorry, I am having trouble answering right now."),
                         Direction::Downstream);
            return;
        }
        if (reply.empty()) {
            logging::warn("Completion returned no text");
            return;
        }
        context->append_message("assistant", reply);
        logging::info("Assistant reply ready", {kv("chars", reply.size())});

        emitter.emit(LifecycleEvent{LifecycleKind::ResponseStarted}, Direction::Downstream);
        for (auto& sentence : utils::split_sentences(reply)) {
            emitter.emit(TextChunk{std::move(sentence)}, Direction::Downstream);
        }
        emitter.emit(LifecycleEvent{LifecycleKind::ResponseEnded}, Direction::Downstream);
    });

    // The utterance stops here; the reply replaces it downstream.
    return {};
}

void ChatCompletionStage::stop() {
    executor_.shutdown();
}

}
}
