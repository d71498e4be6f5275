#include "order_voice/utils/audio.hpp"

#include <cmath>
#include <cstring>

namespace order_voice::utils {

namespace {

uint16_t read_u16(const std::string& data, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(data[offset]) |
                                 (static_cast<uint8_t>(data[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& data, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3])) << 24);
}

}

std::string encode_wav(const std::vector<uint8_t>& pcm, int sample_rate, int channels) {
    if (sample_rate <= 0 || channels < 1 || channels > 0xFFFF) {
        throw WavFormatError("Unsupported WAV format: rate=" + std::to_string(sample_rate) +
                             " channels=" + std::to_string(channels));
    }
    const uint16_t channel_count = static_cast<uint16_t>(channels);
    const uint16_t bits_per_sample = 16;
    const uint32_t rate = static_cast<uint32_t>(sample_rate);
    const uint16_t block_align = channel_count * (bits_per_sample / 8);
    const uint32_t byte_rate = rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(pcm.size());
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(44 + data_size);
    auto append = [&result](const void* data, size_t size) {
        result.append(static_cast<const char*>(data), size);
    };
    auto append_u16 = [&append](uint16_t value) {
        const uint8_t bytes[2] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };
    auto append_u32 = [&append](uint32_t value) {
        const uint8_t bytes[4] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 24) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };

    append("RIFF", 4);
    append_u32(chunk_size);
    append("WAVE", 4);
    append("fmt ", 4);
    append_u32(16);
    append_u16(1);
    append_u16(channel_count);
    append_u32(rate);
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(bits_per_sample);
    append("data", 4);
    append_u32(data_size);
    if (!pcm.empty()) {
        append(pcm.data(), pcm.size());
    }
    return result;
}

PcmAudio decode_wav(const std::string& wav) {
    if (wav.size() < 12 || wav.compare(0, 4, "RIFF") != 0 || wav.compare(8, 4, "WAVE") != 0) {
        throw WavFormatError("not a RIFF/WAVE payload");
    }

    PcmAudio audio;
    bool have_format = false;
    size_t offset = 12;
    while (offset + 8 <= wav.size()) {
        const auto chunk_id = wav.substr(offset, 4);
        uint32_t chunk_size = read_u32(wav, offset + 4);
        const size_t body = offset + 8;
        if (chunk_id == "fmt ") {
            if (chunk_size < 16 || body + 16 > wav.size()) {
                throw WavFormatError("truncated fmt chunk");
            }
            const auto format = read_u16(wav, body);
            audio.channels = read_u16(wav, body + 2);
            audio.sample_rate = static_cast<int>(read_u32(wav, body + 4));
            const auto bits = read_u16(wav, body + 14);
            if ((format != 1 && format != 0xFFFE) || bits != 16) {
                throw WavFormatError("only 16-bit PCM is supported");
            }
            have_format = true;
        } else if (chunk_id == "data") {
            if (!have_format) {
                throw WavFormatError("data chunk before fmt chunk");
            }
            // Streamed WAV headers may carry a placeholder size.
            if (chunk_size == 0xFFFFFFFF || body + chunk_size > wav.size()) {
                chunk_size = static_cast<uint32_t>(wav.size() - body);
            }
            audio.bytes.assign(wav.begin() + static_cast<std::ptrdiff_t>(body),
                               wav.begin() + static_cast<std::ptrdiff_t>(body + chunk_size));
            return audio;
        }
        offset = body + chunk_size + (chunk_size % 2);
    }
    throw WavFormatError("missing data chunk");
}

double pcm_rms(const std::vector<uint8_t>& pcm) {
    const size_t samples = pcm.size() / 2;
    if (samples == 0) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 0; i < samples; ++i) {
        int16_t sample = 0;
        std::memcpy(&sample, pcm.data() + i * 2, sizeof(sample));
        const double normalized = static_cast<double>(sample) / 32768.0;
        sum += normalized * normalized;
    }
    return std::sqrt(sum / static_cast<double>(samples));
}

double pcm_duration_ms(std::size_t byte_count, int sample_rate, int channels) {
    if (sample_rate <= 0 || channels <= 0) {
        return 0.0;
    }
    const double frames = static_cast<double>(byte_count) / (2.0 * channels);
    return frames * 1000.0 / sample_rate;
}

}
