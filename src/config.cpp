#include "order_voice/config.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "order_voice/utils/text.hpp"

namespace order_voice {

const char* const kDefaultSystemPrompt =
    "You are a helpful voice assistant for an online store. Keep responses concise and "
    "conversational.\n"
    "Knowledge Base:\n"
    "- Customers ask about their orders, products, or account details.\n"
    "- When a customer asks for an order status, make sure you have an order number.\n"
    "- If no order number is available, politely ask for it.\n"
    "- When order details are provided, summarize the status and delivery expectation "
    "using the supplied data.\n"
    "- Be empathetic, efficient, and avoid exposing internal system details.";

namespace {

class Settings {
public:
    explicit Settings(const Config::Lookup& lookup) : lookup_(lookup) {}

    std::optional<std::string> get(const std::string& key) const {
        auto value = lookup_(key);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    }

    void read(const std::string& key, std::string& target) const {
        if (auto value = get(key)) {
            target = *value;
        }
    }

    void read(const std::string& key, int& target) const {
        if (auto value = get(key)) {
            target = parse<int>(key, *value, "an integer");
        }
    }

    void read(const std::string& key, double& target) const {
        if (auto value = get(key)) {
            target = parse<double>(key, *value, "a number");
        }
    }

private:
    template <typename T>
    static T parse(const std::string& key, const std::string& text, const char* what) {
        std::istringstream stream(utils::trim(text));
        T result{};
        if (!(stream >> result) || !stream.eof()) {
            throw std::runtime_error(key + " must be " + what);
        }
        return result;
    }

    const Config::Lookup& lookup_;
};

std::string timestamp_suffix() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream stream;
    stream << std::put_time(&local, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        return;
    }
    const std::string export_prefix = "export ";
    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.compare(0, export_prefix.size(), export_prefix) == 0) {
            line = utils::trim(line.substr(export_prefix.size()));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = utils::trim(line.substr(0, eq));
        if (!key.empty()) {
            setenv(key.c_str(), unquote(utils::trim(line.substr(eq + 1))).c_str(), 0);
        }
    }
}

}

Config Config::load() {
    load_dotenv(std::filesystem::current_path() / ".env");
    return from_lookup([](const std::string& key) -> std::optional<std::string> {
        if (const char* value = std::getenv(key.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

Config Config::from_lookup(const Lookup& lookup) {
    const Settings settings(lookup);
    Config config;

    config.groq_api_key = settings.get("GROQ_API_KEY");
    settings.read("GROQ_BASE_URL", config.groq_base_url);
    settings.read("GROQ_STT_MODEL", config.stt_model);
    settings.read("STT_LANGUAGE", config.stt_language);
    settings.read("GROQ_LLM_MODEL", config.llm_model);
    settings.read("GROQ_TTS_MODEL", config.tts_model);
    settings.read("GROQ_TTS_VOICE", config.tts_voice);
    config.system_prompt = settings.get("SYSTEM_PROMPT").value_or(kDefaultSystemPrompt);
    if (auto store_path = settings.get("STORE_PATH")) {
        config.store_path = *store_path;
    }

    settings.read("HOST", config.host);
    settings.read("REST_API_PORT", config.rest_api_port);
    settings.read("WS_PORT", config.ws_port);

    settings.read("AUDIO_IN_SAMPLE_RATE", config.audio_in_sample_rate);
    settings.read("VAD_MIN_VOLUME", config.vad_min_volume);
    settings.read("VAD_START_MS", config.vad_start_ms);
    settings.read("VAD_STOP_MS", config.vad_stop_ms);
    settings.read("MAX_UTTERANCE_MS", config.max_utterance_ms);
    settings.read("AUDIO_LOG_EVERY", config.audio_log_every);
    settings.read("TTS_MAX_INFLIGHT", config.tts_max_inflight);

    settings.read("BACKEND_REQUEST_TIMEOUT", config.backend_request_timeout);
    settings.read("BACKEND_CONNECT_TIMEOUT", config.backend_connect_timeout);
    settings.read("BACKEND_SOCK_READ_TIMEOUT", config.backend_sock_read_timeout);

    settings.read("LOG_LEVEL", config.log_level);
    settings.read("LOG_NAME", config.log_name);
    if (auto filename = settings.get("LOG_FILENAME")) {
        const std::filesystem::path path(*filename);
        const auto stamped =
            path.stem().string() + "_" + timestamp_suffix() + path.extension().string();
        if (auto dir = settings.get("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*dir);
            config.log_filename = (*config.logs_dir / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    return config;
}

void Config::validate() const {
    auto require = [](bool ok, const char* message) {
        if (!ok) {
            throw std::runtime_error(message);
        }
    };
    require(!groq_base_url.empty(), "GROQ_BASE_URL must not be empty");
    require(rest_api_port > 0, "REST_API_PORT must be positive");
    require(ws_port > 0, "WS_PORT must be positive");
    require(rest_api_port != ws_port, "REST_API_PORT and WS_PORT must differ");
    require(audio_in_sample_rate > 0, "AUDIO_IN_SAMPLE_RATE must be positive");
    require(vad_start_ms >= 0 && vad_stop_ms >= 0,
            "VAD_START_MS and VAD_STOP_MS must be zero or positive");
    require(max_utterance_ms > 0, "MAX_UTTERANCE_MS must be positive");
    require(audio_log_every > 0, "AUDIO_LOG_EVERY must be positive");
    require(tts_max_inflight > 0, "TTS_MAX_INFLIGHT must be positive");
}

}
