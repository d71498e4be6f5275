#pragma once

#include <string>
#include <vector>

namespace order_voice::utils {

std::string remove_emojis(const std::string& text);
std::string trim(const std::string& text);
std::string to_lower(std::string text);

// Splits after sentence punctuation; joining the pieces gives back the input.
std::vector<std::string> split_sentences(const std::string& text);

std::string encode_base64(const std::string& data);
// Accepts standard and URL-safe alphabets; throws std::invalid_argument.
std::string decode_base64(const std::string& encoded);

}
