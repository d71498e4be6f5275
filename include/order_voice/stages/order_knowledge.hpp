#pragma once

#include <map>
#include <optional>
#include <string>

#include "order_voice/llm/context.hpp"
#include "order_voice/pipeline/stage.hpp"
#include "order_voice/store/order_store.hpp"

namespace order_voice {
namespace stages {

inline constexpr const char* kOrderLookupTag = "order-lookup";
inline constexpr const char* kOrderNotFoundTag = "order-not-found";
inline constexpr const char* kOrderKnowledgeBaseTag = "order-knowledge-base";

// "order 1003", "order #1003", "order number is 1003" win over any other
// run of three or more digits in the text.
std::optional<std::string> extract_order_number(const std::string& text);
bool detect_order_intent(const std::string& text);
std::string status_hint(OrderStatus status);

// Watches user transcriptions for order questions and injects the matching
// store facts into the LLM context as system messages. Text frames are never altered.
class OrderKnowledgeInjector : public Stage {
public:
    OrderKnowledgeInjector(const OrderStore& store, MessageSink& context);

    std::string name() const override { return "order_knowledge"; }
    Emissions handle(const Frame& frame, Direction direction) override;

    void inspect(const std::string& text);

    // Appends a system message unless the tag already holds identical content.
    bool inject_fact(const std::string& tag, const std::string& content);

    bool awaiting_order_number() const { return awaiting_order_number_; }
    const std::optional<std::string>& last_order_number() const { return last_order_number_; }

private:
    void handle_order_number(const std::string& order_number);

    const OrderStore& store_;
    MessageSink& context_;
    bool awaiting_order_number_ = false;
    std::optional<std::string> last_order_number_;
    std::map<std::string, std::string> facts_;
};

}
}
