#include "order_voice/transport/frame_codec.hpp"

#include <cstdint>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "order_voice/logging.hpp"
#include "order_voice/utils/text.hpp"

namespace order_voice {
namespace transport {

namespace {

constexpr int kMinSampleRate = 8000;
constexpr int kMaxSampleRate = 192000;
constexpr int kMaxChannels = 8;

// Client supplied format fields are taken only when they are integers in range.
int bounded_int_or(const nlohmann::json& payload, const char* key, int low, int high,
                   int fallback) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_number_integer()) {
        return fallback;
    }
    const auto value = it->get<int64_t>();
    if (value < low || value > high) {
        logging::warn("Ignoring out of range audio field",
                      {kv("field", key), kv("value", value)});
        return fallback;
    }
    return static_cast<int>(value);
}

}

std::optional<Frame> decode_client_message(const std::string& payload,
                                           int default_sample_rate) {
    const auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        logging::warn("Dropping malformed client message", {kv("bytes", payload.size())});
        return std::nullopt;
    }

    const auto type_it = message.find("type");
    const auto type = type_it != message.end() && type_it->is_string()
                          ? type_it->get<std::string>()
                          : std::string();
    if (type == "audio") {
        const auto data = message.find("data");
        if (data == message.end() || !data->is_string() || data->get<std::string>().empty()) {
            return std::nullopt;
        }
        std::string pcm;
        try {
            pcm = utils::decode_base64(data->get<std::string>());
        } catch (const std::invalid_argument& ex) {
            logging::warn("Dropping audio with invalid base64", {kv("error", ex.what())});
            return std::nullopt;
        }
        AudioChunk chunk;
        chunk.bytes.assign(pcm.begin(), pcm.end());
        chunk.sample_rate = bounded_int_or(message, "sample_rate", kMinSampleRate,
                                           kMaxSampleRate, default_sample_rate);
        chunk.channels = bounded_int_or(message, "channels", 1, kMaxChannels, 1);
        return Frame{std::move(chunk)};
    }

    if (type == "message") {
        const auto data = message.find("data");
        logging::info("Client message received",
                      {kv("data", data == message.end() ? std::string() : data->dump())});
        return std::nullopt;
    }

    logging::debug("Ignoring client message", {kv("type", type)});
    return std::nullopt;
}

std::string encode_audio(const AudioChunk& chunk) {
    const std::string pcm(chunk.bytes.begin(), chunk.bytes.end());
    nlohmann::json message{{"type", "audio"},
                           {"data", utils::encode_base64(pcm)},
                           {"sample_rate", chunk.sample_rate},
                           {"channels", chunk.channels}};
    return message.dump();
}

std::string encode_message(const TransportMessage& message) {
    auto data = nlohmann::json::parse(message.json_payload, nullptr, false);
    if (data.is_discarded()) {
        data = message.json_payload;
    }
    nlohmann::json wrapped{{"type", "message"}, {"data", std::move(data)}};
    return wrapped.dump();
}

TransportMessage make_error_message(const std::string& message) {
    nlohmann::json payload{{"type", "error"}, {"message", message}};
    return TransportMessage{payload.dump()};
}

}
}
