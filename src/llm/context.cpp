#include "order_voice/llm/context.hpp"

namespace order_voice {

LlmContext::LlmContext(std::vector<ChatMessage> messages)
    : messages_(std::move(messages)) {}

void LlmContext::append_message(const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back({role, content});
}

std::vector<ChatMessage> LlmContext::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::size_t LlmContext::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

nlohmann::json LlmContext::to_json() const {
    nlohmann::json payload = nlohmann::json::array();
    for (const auto& message : messages()) {
        payload.push_back({{"role", message.role}, {"content", message.content}});
    }
    return payload;
}

}
