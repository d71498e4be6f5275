#include "order_voice/stages/order_knowledge.hpp"

#include <regex>
#include <stdexcept>

#include "order_voice/logging.hpp"
#include "order_voice/utils/text.hpp"

namespace order_voice {
namespace stages {

namespace {

const std::regex& explicit_order_pattern() {
    static const std::regex pattern(R"(order\s*(?:number|no\.?|#)?(?:\s*(?:is|:))?\s*(\d{3,}))",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& standalone_number_pattern() {
    static const std::regex pattern(R"(\b(\d{3,})\b)", std::regex::ECMAScript);
    return pattern;
}

std::optional<int64_t> parse_order_id(const std::string& order_number) {
    try {
        return std::stoll(order_number);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}

std::optional<std::string> extract_order_number(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, explicit_order_pattern())) {
        return match[1].str();
    }
    if (std::regex_search(text, match, standalone_number_pattern())) {
        return match[1].str();
    }
    return std::nullopt;
}

bool detect_order_intent(const std::string& text) {
    const auto normalized = utils::to_lower(text);
    for (const char* keyword : {"order status", "track my order", "check my order", "order update"}) {
        if (normalized.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return normalized.find("order") != std::string::npos &&
           normalized.find("status") != std::string::npos;
}

std::string status_hint(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending:
            return "is pending and awaiting processing."
                   " Let the customer know we'll update them once it starts moving.";
        case OrderStatus::Processing:
            return "is being prepared right now."
                   " Share a reassuring update and let them know we'll notify them once it ships.";
        case OrderStatus::Shipped:
            return "has shipped."
                   " Review the provided delivery estimate and repeat it back accurately.";
        case OrderStatus::Delivered:
            return "has already been delivered."
                   " Confirm the delivery date and offer follow-up help if needed.";
        case OrderStatus::Cancelled:
            return "was cancelled."
                   " Clarify the cancellation and offer to help place a new order if appropriate.";
    }
    return std::string("has status ") + to_string(status) + ".";
}

OrderKnowledgeInjector::OrderKnowledgeInjector(const OrderStore& store, MessageSink& context)
    : store_(store),
      context_(context) {}

Emissions OrderKnowledgeInjector::handle(const Frame& frame, Direction direction) {
    if (direction == Direction::Downstream) {
        if (const auto* chunk = std::get_if<TextChunk>(&frame)) {
            inspect(chunk->text);
        }
    }
    return forward(frame, direction);
}

void OrderKnowledgeInjector::inspect(const std::string& raw_text) {
    const auto text = utils::trim(raw_text);
    if (text.empty()) {
        return;
    }
    logging::info("Transcription received", {kv("text", text)});

    const auto order_number = extract_order_number(text);
    if (order_number) {
        logging::info("Order number extracted", {kv("order_number", *order_number)});
        if (order_number != last_order_number_) {
            last_order_number_ = order_number;
            handle_order_number(*order_number);
        }
        return;
    }

    if (detect_order_intent(text) && !awaiting_order_number_) {
        awaiting_order_number_ = true;
        inject_fact(kOrderKnowledgeBaseTag,
                    "The user asked for an order status but has not yet provided an order number."
                    " Ask directly for the order number, mentioning you need it to fetch accurate"
                    " details.");
    }
}

void OrderKnowledgeInjector::handle_order_number(const std::string& order_number) {
    const auto order_id = parse_order_id(order_number);
    const auto order = order_id ? store_.get_order(*order_id) : std::nullopt;
    if (!order) {
        logging::info("Order not found", {kv("order_number", order_number)});
        inject_fact(kOrderNotFoundTag,
                    "No order was found with number " + order_number + "."
                    " Tell the user you couldn't locate that order in the dataset,"
                    " and politely ask them to confirm the digits or share a different order"
                    " number. Do not guess any details.");
        return;
    }

    awaiting_order_number_ = false;
    const auto details = store_.format_order_details(*order);
    const auto hint = "Order " + std::to_string(order->id) + " " + status_hint(order->status);
    inject_fact(kOrderLookupTag,
                "Order lookup result for order number " + order_number + ":\n" + details +
                    "\nUse ONLY this data when responding."
                    " State the order status and delivery expectation exactly as shown,"
                    " and mention key items only if needed."
                    " Never invent additional products, dates, or amounts."
                    " Hint for tone: " + hint);
}

bool OrderKnowledgeInjector::inject_fact(const std::string& tag, const std::string& content) {
    const auto it = facts_.find(tag);
    if (it != facts_.end() && it->second == content) {
        logging::debug("System fact unchanged", {kv("tag", tag)});
        return false;
    }
    context_.append_message("system", content);
    facts_[tag] = content;
    logging::info("System fact injected", {kv("tag", tag), kv("chars", content.size())});
    return true;
}

}
}
