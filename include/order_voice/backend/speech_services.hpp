#pragma once

#include <memory>
#include <string>
#include <vector>

#include "order_voice/backend/client.hpp"
#include "order_voice/config.hpp"
#include "order_voice/llm/context.hpp"

namespace order_voice {

class SpeechToText {
public:
    virtual ~SpeechToText() = default;
    // Takes a complete WAV file and returns the transcript (possibly empty).
    virtual std::string transcribe(const std::string& wav) = 0;
};

class ChatModel {
public:
    virtual ~ChatModel() = default;
    virtual std::string complete(const std::vector<ChatMessage>& messages) = 0;
};

class TextToSpeech {
public:
    virtual ~TextToSpeech() = default;
    // Returns a complete WAV file.
    virtual std::string synthesize(const std::string& text) = 0;
};

struct SpeechServices {
    std::shared_ptr<SpeechToText> stt;
    std::shared_ptr<ChatModel> llm;
    std::shared_ptr<TextToSpeech> tts;
};

class GroqSpeechToText : public SpeechToText {
public:
    GroqSpeechToText(std::shared_ptr<BackendClient> client, std::string model, std::string language);
    std::string transcribe(const std::string& wav) override;

private:
    std::shared_ptr<BackendClient> client_;
    std::string model_;
    std::string language_;
};

class GroqChatModel : public ChatModel {
public:
    GroqChatModel(std::shared_ptr<BackendClient> client, std::string model);
    std::string complete(const std::vector<ChatMessage>& messages) override;

private:
    std::shared_ptr<BackendClient> client_;
    std::string model_;
};

class GroqTextToSpeech : public TextToSpeech {
public:
    GroqTextToSpeech(std::shared_ptr<BackendClient> client, std::string model, std::string voice);
    std::string synthesize(const std::string& text) override;

private:
    std::shared_ptr<BackendClient> client_;
    std::string model_;
    std::string voice_;
};

// Builds the Groq-backed services; requires config.groq_api_key.
SpeechServices make_groq_services(const Config& config);

}
