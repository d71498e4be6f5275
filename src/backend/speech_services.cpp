#include "order_voice/backend/speech_services.hpp"

#include <chrono>

#include "order_voice/logging.hpp"
#include "order_voice/metrics.hpp"

namespace order_voice {

namespace {

// Runs one backend call, recording its latency or its failure under `method`.
template <typename Fn>
auto timed_call(const char* method, Fn&& fn) -> decltype(fn()) {
    const auto start = std::chrono::steady_clock::now();
    try {
        auto result = fn();
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        Metrics::instance().observe_response_time(method, elapsed);
        Metrics::instance().observe_response_summary(method, elapsed);
        logging::debug("Backend call finished",
                       {kv("method", method), kv("elapsed_sec", elapsed)});
        return result;
    } catch (const std::exception&) {
        Metrics::instance().observe_backend_error(method);
        throw;
    }
}

std::chrono::seconds to_seconds(double value) {
    return std::chrono::seconds(static_cast<int>(value));
}

}

GroqSpeechToText::GroqSpeechToText(std::shared_ptr<BackendClient> client,
                                   std::string model,
                                   std::string language)
    : client_(std::move(client)),
      model_(std::move(model)),
      language_(std::move(language)) {}

std::string GroqSpeechToText::transcribe(const std::string& wav) {
    return timed_call("transcribe", [&]() {
        const auto response = client_->post_multipart(
            "/audio/transcriptions",
            {{"file", wav, "audio.wav", "audio/wav"},
             {"model", model_, "", ""},
             {"language", language_, "", ""},
             {"response_format", "json", "", ""}});
        if (!response.contains("text") || !response["text"].is_string()) {
            throw BackendError("Transcription response has no text");
        }
        return response["text"].get<std::string>();
    });
}

GroqChatModel::GroqChatModel(std::shared_ptr<BackendClient> client, std::string model)
    : client_(std::move(client)),
      model_(std::move(model)) {}

std::string GroqChatModel::complete(const std::vector<ChatMessage>& messages) {
    return timed_call("complete", [&]() {
        nlohmann::json body;
        body["model"] = model_;
        body["messages"] = nlohmann::json::array();
        for (const auto& message : messages) {
            body["messages"].push_back({{"role", message.role}, {"content", message.content}});
        }
        const auto response = client_->post_json("/chat/completions", body);
        try {
            const auto& content = response.at("choices").at(0).at("message").at("content");
            return content.is_string() ? content.get<std::string>() : std::string();
        } catch (const nlohmann::json::exception& ex) {
            throw BackendError(std::string("Completion response is malformed: ") + ex.what());
        }
    });
}

GroqTextToSpeech::GroqTextToSpeech(std::shared_ptr<BackendClient> client,
                                   std::string model,
                                   std::string voice)
    : client_(std::move(client)),
      model_(std::move(model)),
      voice_(std::move(voice)) {}

std::string GroqTextToSpeech::synthesize(const std::string& text) {
    return timed_call("synthesize", [&]() {
        nlohmann::json body{{"model", model_},
                            {"voice", voice_},
                            {"input", text},
                            {"response_format", "wav"}};
        return client_->post_json_binary("/audio/speech", body);
    });
}

SpeechServices make_groq_services(const Config& config) {
    if (!config.groq_api_key) {
        throw BackendError("GROQ_API_KEY is required");
    }
    auto client = std::make_shared<BackendClient>(
        config.groq_base_url, config.groq_api_key,
        BackendRequestOptions{to_seconds(config.backend_request_timeout),
                              to_seconds(config.backend_connect_timeout),
                              to_seconds(config.backend_sock_read_timeout)});
    SpeechServices services;
    services.stt = std::make_shared<GroqSpeechToText>(client, config.stt_model,
                                                      config.stt_language);
    services.llm = std::make_shared<GroqChatModel>(client, config.llm_model);
    services.tts = std::make_shared<GroqTextToSpeech>(client, config.tts_model,
                                                      config.tts_voice);
    return services;
}

}
