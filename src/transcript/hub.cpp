#include "order_voice/transcript/hub.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>

#include "order_voice/logging.hpp"
#include "order_voice/metrics.hpp"

namespace order_voice {

namespace {

std::string current_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}

}

const char* to_string(Speaker speaker) {
    return speaker == Speaker::User ? "user" : "bot";
}

nlohmann::json to_json(const std::vector<TranscriptEntry>& entries) {
    nlohmann::json payload = nlohmann::json::array();
    for (const auto& entry : entries) {
        payload.push_back({{"type", to_string(entry.speaker)},
                           {"message", entry.text},
                           {"time", entry.timestamp}});
    }
    return payload;
}

bool TranscriptHub::Subscription::deliver(uint64_t revision, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed.load() || revision <= last_revision) {
        return false;
    }
    sink->send_text(payload);
    last_revision = revision;
    return true;
}

void TranscriptHub::Subscription::close() {
    closed = true;
}

void TranscriptHub::add_message(Speaker speaker, const std::string& text) {
    try {
        (void)nlohmann::json(text).dump();
    } catch (const nlohmann::json::type_error& ex) {
        throw std::invalid_argument(std::string("transcript text is not valid UTF-8: ") +
                                    ex.what());
    }
    std::vector<Delivery> deliveries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({speaker, text, current_timestamp()});
        ++revision_;
        if (subscriptions_.empty()) {
            return;
        }
        auto payload = std::make_shared<const std::string>(to_json(entries_).dump());
        deliveries.reserve(subscriptions_.size());
        for (const auto& subscription : subscriptions_) {
            deliveries.push_back({subscription, revision_, payload});
        }
    }
    logging::debug("Transcript message broadcast",
                   {kv("speaker", to_string(speaker)), kv("subscribers", deliveries.size())});
    fan_out(deliveries);
}

void TranscriptHub::subscribe(const std::shared_ptr<TranscriptSubscriber>& subscriber) {
    if (!subscriber) {
        return;
    }
    std::vector<Delivery> deliveries;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto existing = std::find_if(
            subscriptions_.begin(), subscriptions_.end(),
            [&](const auto& subscription) { return subscription->sink == subscriber; });
        if (existing != subscriptions_.end()) {
            return;
        }
        auto subscription = std::make_shared<Subscription>(subscriber);
        subscriptions_.push_back(subscription);
        count = subscriptions_.size();
        if (!entries_.empty()) {
            deliveries.push_back({subscription, revision_,
                                  std::make_shared<const std::string>(to_json(entries_).dump())});
        }
    }
    Metrics::instance().set_transcript_subscribers(count);
    logging::info("Transcript subscriber connected",
                  {kv("subscriber", subscriber->describe()), kv("subscribers", count)});
    fan_out(deliveries);
}

void TranscriptHub::unsubscribe(const std::shared_ptr<TranscriptSubscriber>& subscriber) {
    std::size_t count = 0;
    bool cleared = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(
            subscriptions_.begin(), subscriptions_.end(),
            [&](const auto& subscription) { return subscription->sink == subscriber; });
        if (it != subscriptions_.end()) {
            (*it)->close();
            subscriptions_.erase(it);
        }
        count = subscriptions_.size();
        if (subscriptions_.empty() && !entries_.empty()) {
            entries_.clear();
            cleared = true;
        }
    }
    Metrics::instance().set_transcript_subscribers(count);
    logging::info("Transcript subscriber disconnected",
                  {kv("subscriber", subscriber ? subscriber->describe() : "none"),
                   kv("subscribers", count)});
    if (cleared) {
        logging::info("Transcript cleared (no subscribers left)");
    }
}

std::vector<TranscriptEntry> TranscriptHub::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::string TranscriptHub::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return to_json(entries_).dump();
}

std::size_t TranscriptHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void TranscriptHub::fan_out(const std::vector<Delivery>& deliveries) {
    auto deliver = [this](const Delivery& delivery) {
        try {
            delivery.subscription->deliver(delivery.revision, *delivery.payload);
        } catch (const std::exception& ex) {
            remove_failed(delivery.subscription, ex.what());
        }
    };

    if (deliveries.size() == 1) {
        deliver(deliveries.front());
        return;
    }
    std::vector<std::future<void>> pending;
    pending.reserve(deliveries.size());
    for (const auto& delivery : deliveries) {
        pending.push_back(std::async(std::launch::async, deliver, delivery));
    }
    for (auto& task : pending) {
        task.get();
    }
}

void TranscriptHub::remove_failed(const std::shared_ptr<Subscription>& subscription,
                                  const std::string& reason) {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription->close();
        subscriptions_.erase(
            std::remove(subscriptions_.begin(), subscriptions_.end(), subscription),
            subscriptions_.end());
        count = subscriptions_.size();
    }
    Metrics::instance().set_transcript_subscribers(count);
    logging::warn("Removing transcript subscriber due to send error",
                  {kv("subscriber", subscription->sink->describe()),
                   kv("error", reason),
                   kv("subscribers", count)});
}

}
