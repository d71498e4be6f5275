#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace order_voice {

struct ChatMessage {
    std::string role;
    std::string content;
};

// The one capability the knowledge stages need from the conversation history.
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void append_message(const std::string& role, const std::string& content) = 0;
};

// Conversation history of one session. Appended to by the session worker
// while completions read snapshots from backend threads.
class LlmContext : public MessageSink {
public:
    LlmContext() = default;
    explicit LlmContext(std::vector<ChatMessage> messages);

    void append_message(const std::string& role, const std::string& content) override;
    std::vector<ChatMessage> messages() const;
    std::size_t size() const;
    nlohmann::json to_json() const;

private:
    mutable std::mutex mutex_;
    std::vector<ChatMessage> messages_;
};

}
