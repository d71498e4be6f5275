#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "order_voice/backend/speech_services.hpp"
#include "order_voice/config.hpp"
#include "order_voice/llm/context.hpp"
#include "order_voice/pipeline/pipeline.hpp"
#include "order_voice/stages/transport_output.hpp"
#include "order_voice/store/order_store.hpp"
#include "order_voice/transcript/hub.hpp"

namespace order_voice {

// One connected voice client: its stage chain, LLM context and pipeline.
class VoiceSession {
public:
    using SendFn = stages::TransportOutput::SendFn;
    using TerminatedHandler = std::function<void(const std::string& reason)>;

    VoiceSession(std::string id,
                 const Config& config,
                 SpeechServices services,
                 const OrderStore& store,
                 TranscriptHub& hub,
                 SendFn send);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    // Starts the pipeline and pushes SessionStart. `on_terminated` runs on
    // the pipeline thread when a stage fails.
    void start(TerminatedHandler on_terminated = nullptr);
    // Decodes one client message and feeds it to the pipeline.
    void receive(const std::string& payload);
    // Idempotent; safe from any thread including the pipeline's.
    void close();

    const std::string& id() const { return id_; }
    bool closed() const { return closed_.load(); }
    std::shared_ptr<LlmContext> context() const { return context_; }
    Pipeline& pipeline() { return *pipeline_; }

private:
    std::string id_;
    int default_sample_rate_;
    std::shared_ptr<LlmContext> context_;
    std::unique_ptr<Pipeline> pipeline_;
    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};
};

}
