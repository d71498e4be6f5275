#include <catch2/catch_test_macros.hpp>

#include "order_voice/transcript/hub.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace order_voice;

namespace {

class RecordingSubscriber : public TranscriptSubscriber {
public:
    void send_text(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        payloads_.push_back(payload);
    }

    std::vector<std::string> payloads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return payloads_;
    }

    nlohmann::json last() const { return nlohmann::json::parse(payloads().back()); }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> payloads_;
};

class BrokenSubscriber : public TranscriptSubscriber {
public:
    void send_text(const std::string&) override { throw DeliveryError("socket closed"); }
    std::string describe() const override { return "broken"; }
};

}

TEST_CASE("the last unsubscribe clears the transcript") {
    TranscriptHub hub;
    auto a = std::make_shared<RecordingSubscriber>();
    hub.subscribe(a);
    hub.add_message(Speaker::User, "hi");
    hub.add_message(Speaker::Bot, "hello");
    REQUIRE(hub.entries().size() == 2);
    REQUIRE(a->payloads().size() == 2);

    hub.unsubscribe(a);
    REQUIRE(hub.entries().empty());

    auto b = std::make_shared<RecordingSubscriber>();
    hub.subscribe(b);
    REQUIRE(b->payloads().empty());
    hub.add_message(Speaker::User, "fresh start");
    const auto snapshot = b->last();
    REQUIRE(snapshot.size() == 1);
    REQUIRE(snapshot[0]["type"] == "user");
    REQUIRE(snapshot[0]["message"] == "fresh start");
}

TEST_CASE("new subscribers immediately receive the current transcript") {
    TranscriptHub hub;
    auto first = std::make_shared<RecordingSubscriber>();
    hub.subscribe(first);
    hub.add_message(Speaker::User, "where is my order");

    auto second = std::make_shared<RecordingSubscriber>();
    hub.subscribe(second);
    REQUIRE(second->payloads().size() == 1);
    REQUIRE(second->last()[0]["message"] == "where is my order");
    REQUIRE(hub.subscriber_count() == 2);
}

TEST_CASE("entries without subscribers are kept until someone watches") {
    TranscriptHub hub;
    hub.add_message(Speaker::Bot, "Welcome");
    REQUIRE(hub.entries().size() == 1);

    auto observer = std::make_shared<RecordingSubscriber>();
    hub.subscribe(observer);
    REQUIRE(observer->payloads().size() == 1);
}

TEST_CASE("a failing subscriber is dropped without affecting the others") {
    TranscriptHub hub;
    auto healthy = std::make_shared<RecordingSubscriber>();
    auto broken = std::make_shared<BrokenSubscriber>();
    hub.subscribe(healthy);
    hub.subscribe(broken);
    REQUIRE(hub.subscriber_count() == 2);

    hub.add_message(Speaker::User, "hello");
    REQUIRE(hub.subscriber_count() == 1);
    REQUIRE(healthy->payloads().size() == 1);
    REQUIRE(hub.entries().size() == 1);

    hub.add_message(Speaker::Bot, "hi there");
    REQUIRE(healthy->last().size() == 2);
}

TEST_CASE("subscribing twice registers the connection once") {
    TranscriptHub hub;
    auto observer = std::make_shared<RecordingSubscriber>();
    hub.subscribe(observer);
    hub.subscribe(observer);
    REQUIRE(hub.subscriber_count() == 1);
    hub.add_message(Speaker::User, "once");
    REQUIRE(observer->payloads().size() == 1);
}

TEST_CASE("each subscriber sees snapshots grow in append order") {
    TranscriptHub hub;
    auto a = std::make_shared<RecordingSubscriber>();
    auto b = std::make_shared<RecordingSubscriber>();
    hub.subscribe(a);
    hub.subscribe(b);

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&hub, w]() {
            for (int i = 0; i < 10; ++i) {
                hub.add_message(Speaker::User, "w" + std::to_string(w) + "-" + std::to_string(i));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    REQUIRE(hub.entries().size() == 40);
    for (const auto& subscriber : {a, b}) {
        std::size_t previous = 0;
        for (const auto& payload : subscriber->payloads()) {
            const auto size = nlohmann::json::parse(payload).size();
            REQUIRE(size > previous);
            previous = size;
        }
        REQUIRE(previous == 40);
    }
}

TEST_CASE("text that cannot be serialized is refused and leaves the transcript usable") {
    TranscriptHub hub;
    auto watcher = std::make_shared<RecordingSubscriber>();
    hub.subscribe(watcher);
    hub.add_message(Speaker::User, "hi");

    REQUIRE_THROWS_AS(hub.add_message(Speaker::User, "bad \xff\xfe bytes"), std::invalid_argument);
    REQUIRE(hub.entries().size() == 1);

    hub.add_message(Speaker::Bot, "hello");
    REQUIRE(watcher->last().size() == 2);
    REQUIRE(nlohmann::json::parse(hub.snapshot()).size() == 2);
}
