#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "order_voice/pipeline/frame.hpp"

namespace order_voice {
namespace stages {

// Synthesizes queued sentences concurrently (at most max_inflight at once)
// and delivers the results strictly in enqueue order. End-of-response
// markers travel through the same queue so they are delivered after the
// audio that precedes them.
class SynthesisQueue : public std::enable_shared_from_this<SynthesisQueue> {
    struct Token {
        explicit Token() = default;
    };

public:
    // Returns nullopt when synthesis failed; the failure is reported by the callee.
    using SynthFn = std::function<std::optional<AudioChunk>(const std::string& text)>;

    struct Delivery {
        std::string text;
        std::optional<AudioChunk> audio;
        bool end_of_response = false;
    };
    using DeliverFn = std::function<void(const Delivery& delivery)>;

    // Instances are always shared; see create().
    SynthesisQueue(Token, int max_inflight, SynthFn synth_fn, DeliverFn deliver_fn);

    static std::shared_ptr<SynthesisQueue> create(int max_inflight,
                                                  SynthFn synth_fn,
                                                  DeliverFn deliver_fn);

    void enqueue(const std::string& text);
    void mark_end_of_response();
    void cancel();
    bool has_queue() const;
    std::size_t inflight() const;

private:
    using Result = std::optional<AudioChunk>;

    struct Task {
        std::string text;
        bool end_of_response = false;
        std::shared_future<Result> future;
    };

    struct PendingTask {
        std::shared_ptr<std::packaged_task<Result()>> task;
    };

    void deliver_ready();
    void maybe_start_synthesis();
    void on_synthesis_finished();

    int max_inflight_;
    SynthFn synth_fn_;
    DeliverFn deliver_fn_;

    mutable std::mutex mutex_;
    std::mutex deliver_mutex_;
    std::deque<Task> queue_;
    std::deque<PendingTask> pending_;
    std::size_t inflight_ = 0;
    std::atomic<bool> canceled_{false};
};

}
}
