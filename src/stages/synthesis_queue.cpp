#include "order_voice/stages/synthesis_queue.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

#include "order_voice/logging.hpp"
#include "order_voice/utils/async.hpp"

namespace order_voice {
namespace stages {

std::shared_ptr<SynthesisQueue> SynthesisQueue::create(int max_inflight,
                                                       SynthFn synth_fn,
                                                       DeliverFn deliver_fn) {
    return std::make_shared<SynthesisQueue>(Token{}, max_inflight, std::move(synth_fn),
                                            std::move(deliver_fn));
}

SynthesisQueue::SynthesisQueue(Token, int max_inflight, SynthFn synth_fn, DeliverFn deliver_fn)
    : max_inflight_(max_inflight),
      synth_fn_(std::move(synth_fn)),
      deliver_fn_(std::move(deliver_fn)) {}

void SynthesisQueue::enqueue(const std::string& text) {
    if (canceled_.load()) {
        return;
    }
    auto task_ptr = std::make_shared<std::packaged_task<Result()>>(
        [synth = synth_fn_, text]() -> Result { return synth(text); });
    auto future = task_ptr->get_future().share();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back({text, false, future});
        pending_.push_back({task_ptr});
    }
    maybe_start_synthesis();
}

void SynthesisQueue::mark_end_of_response() {
    if (canceled_.load()) {
        return;
    }
    std::promise<Result> done;
    done.set_value(std::nullopt);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back({std::string(), true, done.get_future().share()});
    }
    deliver_ready();
}

void SynthesisQueue::cancel() {
    canceled_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    pending_.clear();
}

bool SynthesisQueue::has_queue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !queue_.empty();
}

std::size_t SynthesisQueue::inflight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_;
}

void SynthesisQueue::deliver_ready() {
    // Deliveries from different threads must not interleave.
    std::lock_guard<std::mutex> deliver_lock(deliver_mutex_);
    while (!canceled_.load()) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return;
            }
            auto& front = queue_.front();
            if (front.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return;
            }
            task = front;
            queue_.pop_front();
        }

        Delivery delivery;
        delivery.text = task.text;
        delivery.end_of_response = task.end_of_response;
        try {
            delivery.audio = task.future.get();
        } catch (const std::exception& ex) {
            logging::error("Synthesis task failed", {kv("error", ex.what())});
        }
        if (deliver_fn_) {
            deliver_fn_(delivery);
        }
    }
}

void SynthesisQueue::maybe_start_synthesis() {
    std::vector<PendingTask> to_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto max_inflight = static_cast<std::size_t>(std::max(1, max_inflight_));
        while (inflight_ < max_inflight && !pending_.empty()) {
            to_start.push_back(std::move(pending_.front()));
            pending_.pop_front();
            ++inflight_;
        }
    }

    for (auto& task : to_start) {
        utils::run_async([self = shared_from_this(), task_ptr = task.task]() {
            (*task_ptr)();
            self->on_synthesis_finished();
        }, "synthesis");
    }
}

void SynthesisQueue::on_synthesis_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inflight_ > 0) {
            --inflight_;
        }
    }
    deliver_ready();
    if (!canceled_.load()) {
        maybe_start_synthesis();
    }
}

}
}
