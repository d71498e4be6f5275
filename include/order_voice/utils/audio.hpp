#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace order_voice::utils {

class WavFormatError : public std::runtime_error {
public:
    explicit WavFormatError(const std::string& message) : std::runtime_error(message) {}
};

struct PcmAudio {
    std::vector<uint8_t> bytes; // 16-bit little-endian samples, interleaved.
    int sample_rate = 16000;
    int channels = 1;
};

std::string encode_wav(const std::vector<uint8_t>& pcm, int sample_rate, int channels);
// Only 16-bit PCM is accepted.
PcmAudio decode_wav(const std::string& wav);

// Root mean square of the samples, scaled to [0, 1].
double pcm_rms(const std::vector<uint8_t>& pcm);
double pcm_duration_ms(std::size_t byte_count, int sample_rate, int channels);

}
