#include "order_voice/utils/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

#include <websocketpp/base64/base64.hpp>

namespace order_voice::utils {

namespace {

bool is_emoji_codepoint(uint32_t codepoint) {
    return (codepoint >= 0x1F600 && codepoint <= 0x1F64F) ||
           (codepoint >= 0x1F300 && codepoint <= 0x1F5FF) ||
           (codepoint >= 0x1F680 && codepoint <= 0x1F6FF) ||
           (codepoint >= 0x1F700 && codepoint <= 0x1F77F) ||
           (codepoint >= 0x1F780 && codepoint <= 0x1F7FF) ||
           (codepoint >= 0x1F800 && codepoint <= 0x1F8FF) ||
           (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||
           (codepoint >= 0x1FA00 && codepoint <= 0x1FA6F) ||
           (codepoint >= 0x1FA70 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2702 && codepoint <= 0x27B0) ||
           (codepoint >= 0x24C2 && codepoint <= 0x1F251);
}

bool decode_utf8(const std::string& text, size_t index, uint32_t& codepoint, size_t& length) {
    const auto byte = static_cast<unsigned char>(text[index]);
    if (byte < 0x80) {
        codepoint = byte;
        length = 1;
        return true;
    }
    if ((byte & 0xE0) == 0xC0 && index + 1 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        if ((b1 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x1F) << 6) | (b1 & 0x3F);
        length = 2;
        return codepoint >= 0x80;
    }
    if ((byte & 0xF0) == 0xE0 && index + 2 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
        length = 3;
        return codepoint >= 0x800;
    }
    if ((byte & 0xF8) == 0xF0 && index + 3 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        const auto b3 = static_cast<unsigned char>(text[index + 3]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x07) << 18) |
                    ((b1 & 0x3F) << 12) |
                    ((b2 & 0x3F) << 6) |
                    (b3 & 0x3F);
        length = 4;
        return codepoint >= 0x10000 && codepoint <= 0x10FFFF;
    }
    return false;
}

}

std::string remove_emojis(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        size_t length = 1;
        if (!decode_utf8(text, i, codepoint, length)) {
            result.push_back(text[i]);
            ++i;
            continue;
        }
        if (!is_emoji_codepoint(codepoint)) {
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        current.push_back(text[i]);
        const char ch = text[i];
        if (ch != '.' && ch != '!' && ch != '?' && ch != '\n') {
            continue;
        }
        // Keep the whitespace that follows with the finished sentence.
        bool spaced = ch == '\n';
        while (i + 1 < text.size() && std::isspace(static_cast<unsigned char>(text[i + 1]))) {
            current.push_back(text[++i]);
            spaced = true;
        }
        if (spaced && i + 1 < text.size() && !trim(current).empty()) {
            sentences.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        sentences.push_back(std::move(current));
    }
    return sentences;
}

std::string encode_base64(const std::string& data) {
    return websocketpp::base64_encode(data);
}

std::string decode_base64(const std::string& encoded) {
    // websocketpp stops silently at the first foreign byte, so the alphabet is
    // checked here. URL-safe input and missing padding are normalized first.
    std::string normalized;
    normalized.reserve(encoded.size() + 2);
    bool padding = false;
    for (unsigned char ch : encoded) {
        if (std::isspace(ch)) {
            continue;
        }
        if (ch == '=') {
            padding = true;
            continue;
        }
        if (padding) {
            throw std::invalid_argument("invalid base64 character");
        }
        if (ch == '-') {
            ch = '+';
        } else if (ch == '_') {
            ch = '/';
        } else if (!std::isalnum(ch) && ch != '+' && ch != '/') {
            throw std::invalid_argument("invalid base64 character");
        }
        normalized.push_back(static_cast<char>(ch));
    }
    while (normalized.size() % 4 != 0) {
        normalized.push_back('=');
    }
    return websocketpp::base64_decode(normalized);
}

}
