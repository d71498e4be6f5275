#include <catch2/catch_test_macros.hpp>

#include "order_voice/config.hpp"

#include <map>
#include <stdexcept>
#include <string>

using order_voice::Config;

namespace {

Config::Lookup lookup_from(std::map<std::string, std::string> values) {
    return [values](const std::string& key) -> std::optional<std::string> {
        auto it = values.find(key);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}

TEST_CASE("Config defaults when nothing is set") {
    const auto config = Config::from_lookup(lookup_from({}));
    REQUIRE_FALSE(config.groq_api_key);
    REQUIRE(config.groq_base_url == "https://api.groq.com/openai/v1");
    REQUIRE(config.rest_api_port == 8000);
    REQUIRE(config.ws_port == 8001);
    REQUIRE(config.audio_in_sample_rate == 16000);
    REQUIRE(config.tts_max_inflight == 3);
    REQUIRE(config.max_utterance_ms == 30000);
    REQUIRE(config.system_prompt == order_voice::kDefaultSystemPrompt);
    REQUIRE(config.store_path.string() == "data/store.json");
    REQUIRE_FALSE(config.log_filename);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config reads overrides and treats empty values as unset") {
    const auto config = Config::from_lookup(lookup_from({{"GROQ_API_KEY", ""},
                                                         {"WS_PORT", "9001"},
                                                         {"VAD_MIN_VOLUME", "0.05"},
                                                         {"STORE_PATH", "/srv/store.json"},
                                                         {"LOG_FILENAME", "voice.log"},
                                                         {"LOGS_DIR", "/var/log/voice"}}));
    REQUIRE_FALSE(config.groq_api_key);
    REQUIRE(config.ws_port == 9001);
    REQUIRE(config.vad_min_volume == 0.05);
    REQUIRE(config.store_path.string() == "/srv/store.json");
    REQUIRE(config.log_filename);
    REQUIRE(config.log_filename->rfind("/var/log/voice/voice_", 0) == 0);
    REQUIRE(config.log_filename->size() > 4);
    REQUIRE(config.log_filename->substr(config.log_filename->size() - 4) == ".log");
}

TEST_CASE("Config rejects malformed and out of range values") {
    REQUIRE_THROWS_AS(Config::from_lookup(lookup_from({{"REST_API_PORT", "80x"}})),
                      std::runtime_error);
    REQUIRE_THROWS_AS(Config::from_lookup(lookup_from({{"TTS_MAX_INFLIGHT", "1.5"}})),
                      std::runtime_error);

    auto same_ports = Config::from_lookup(lookup_from({{"WS_PORT", "8000"}}));
    REQUIRE_THROWS_AS(same_ports.validate(), std::runtime_error);

    auto no_inflight = Config::from_lookup(lookup_from({{"TTS_MAX_INFLIGHT", "0"}}));
    REQUIRE_THROWS_AS(no_inflight.validate(), std::runtime_error);

    auto no_utterance = Config::from_lookup(lookup_from({{"MAX_UTTERANCE_MS", "0"}}));
    REQUIRE_THROWS_AS(no_utterance.validate(), std::runtime_error);
}
