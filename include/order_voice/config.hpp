#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace order_voice {

struct Config {
    std::optional<std::string> groq_api_key;
    std::string groq_base_url = "https://api.groq.com/openai/v1";
    std::string stt_model = "whisper-large-v3-turbo";
    std::string stt_language = "en";
    std::string llm_model = "llama-3.3-70b-versatile";
    std::string tts_model = "playai-tts";
    std::string tts_voice = "Celeste-PlayAI";
    std::string system_prompt;
    std::filesystem::path store_path = "data/store.json";
    std::string host = "0.0.0.0";
    int rest_api_port = 8000;
    int ws_port = 8001;
    int audio_in_sample_rate = 16000;
    double vad_min_volume = 0.02;
    int vad_start_ms = 150;
    int vad_stop_ms = 150;
    int max_utterance_ms = 30000;
    int audio_log_every = 50;
    int tts_max_inflight = 3;
    double backend_request_timeout = 60.0;
    double backend_connect_timeout = 60.0;
    double backend_sock_read_timeout = 60.0;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "order_voice";

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Reads ./.env into the environment (existing variables win), then the environment.
    static Config load();
    // Builds a config from `lookup`; unset or empty keys keep their defaults.
    static Config from_lookup(const Lookup& lookup);
    void validate() const;
};

// Prompt seeded into every session's LLM context when SYSTEM_PROMPT is unset.
extern const char* const kDefaultSystemPrompt;

}
