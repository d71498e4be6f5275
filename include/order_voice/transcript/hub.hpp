#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace order_voice {

enum class Speaker {
    User,
    Bot
};

const char* to_string(Speaker speaker);

struct TranscriptEntry {
    Speaker speaker;
    std::string text;
    std::string timestamp; // Local time, "%Y-%m-%d %H:%M:%S".
};

nlohmann::json to_json(const std::vector<TranscriptEntry>& entries);

class DeliveryError : public std::runtime_error {
public:
    explicit DeliveryError(const std::string& message) : std::runtime_error(message) {}
};

// An observer connection. send_text throws DeliveryError (or any
// std::exception) when the payload cannot be delivered.
class TranscriptSubscriber {
public:
    virtual ~TranscriptSubscriber() = default;
    virtual void send_text(const std::string& payload) = 0;
    virtual std::string describe() const { return "subscriber"; }
};

// Process-wide live transcript shared by all voice sessions and observers.
//
// Entries and subscribers change only under one mutex. Snapshots are
// serialized under that mutex and delivered outside it, one task per
// subscriber. Each subscriber remembers the newest revision it was sent and
// drops older snapshots, so it observes appends in order. The transcript is
// cleared when the last subscriber leaves.
class TranscriptHub {
public:
    TranscriptHub() = default;
    TranscriptHub(const TranscriptHub&) = delete;
    TranscriptHub& operator=(const TranscriptHub&) = delete;

    // Throws std::invalid_argument, leaving the transcript unchanged, when
    // text cannot be serialized (invalid UTF-8).
    void add_message(Speaker speaker, const std::string& text);
    void subscribe(const std::shared_ptr<TranscriptSubscriber>& subscriber);
    void unsubscribe(const std::shared_ptr<TranscriptSubscriber>& subscriber);

    std::vector<TranscriptEntry> entries() const;
    std::string snapshot() const;
    std::size_t subscriber_count() const;

private:
    struct Subscription {
        explicit Subscription(std::shared_ptr<TranscriptSubscriber> sink)
            : sink(std::move(sink)) {}

        // False once removed or superseded by a newer revision.
        bool deliver(uint64_t revision, const std::string& payload);
        void close();

        std::shared_ptr<TranscriptSubscriber> sink;
        std::mutex mutex;
        uint64_t last_revision = 0;
        std::atomic<bool> closed{false};
    };

    struct Delivery {
        std::shared_ptr<Subscription> subscription;
        uint64_t revision;
        std::shared_ptr<const std::string> payload;
    };

    void fan_out(const std::vector<Delivery>& deliveries);
    void remove_failed(const std::shared_ptr<Subscription>& subscription, const std::string& reason);

    mutable std::mutex mutex_;
    std::vector<TranscriptEntry> entries_;
    std::vector<std::shared_ptr<Subscription>> subscriptions_;
    uint64_t revision_ = 0;
};

}
