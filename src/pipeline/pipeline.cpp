#include "order_voice/pipeline/pipeline.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "order_voice/logging.hpp"

namespace order_voice {

namespace detail {

struct PipelineQueue {
    struct Item {
        Frame frame;
        Direction direction;
        long next;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Item> items;
    bool stopping = false; // Drain what is queued, accept nothing new.
    bool closed = false;   // Terminated; queued items were discarded.

    bool enqueue(Frame frame, Direction direction, long next) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping || closed) {
                return false;
            }
            items.push_back({std::move(frame), direction, next});
        }
        cv.notify_one();
        return true;
    }
};

}

FrameEmitter::FrameEmitter(std::weak_ptr<detail::PipelineQueue> queue, std::size_t origin)
    : queue_(std::move(queue)),
      origin_(origin) {}

void FrameEmitter::emit(Frame frame, Direction direction) const {
    auto queue = queue_.lock();
    if (!queue) {
        return;
    }
    const long origin = static_cast<long>(origin_);
    const long next = direction == Direction::Downstream ? origin + 1 : origin - 1;
    queue->enqueue(std::move(frame), direction, next);
}

bool FrameEmitter::attached() const {
    return !queue_.expired();
}

// Everything the worker touches. The worker holds its own reference so a
// detached worker never reaches into a destroyed Pipeline.
struct Pipeline::Core {
    std::vector<std::shared_ptr<Stage>> stages;
    std::shared_ptr<detail::PipelineQueue> queue = std::make_shared<detail::PipelineQueue>();
    Sink sink;
    TerminatedHandler on_terminated;
    std::atomic<bool> halted{false};
    std::atomic<bool> terminated{false};
    std::atomic<bool> stages_stopped{false};

    void run_loop();
    void route(const Frame& frame, Direction direction, long index);
    void terminate(const PipelineTerminated& error);
    void stop_stages();
};

void Pipeline::Core::run_loop() {
    while (true) {
        detail::PipelineQueue::Item item{TextChunk{}, Direction::Downstream, 0};
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->cv.wait(lock, [this]() {
                return !queue->items.empty() || queue->stopping || queue->closed;
            });
            if (queue->closed || queue->items.empty()) {
                return;
            }
            item = std::move(queue->items.front());
            queue->items.pop_front();
        }
        try {
            route(item.frame, item.direction, item.next);
        } catch (const PipelineTerminated& err) {
            terminate(err);
            return;
        }
    }
}

void Pipeline::Core::route(const Frame& frame, Direction direction, long index) {
    if (index < 0 || index >= static_cast<long>(stages.size())) {
        if (sink) {
            sink(frame, direction);
        }
        return;
    }

    auto& stage = stages[static_cast<std::size_t>(index)];
    Emissions emissions;
    try {
        emissions = stage->handle(frame, direction);
    } catch (const std::exception& ex) {
        throw PipelineTerminated(stage->name(), ex.what());
    }

    for (const auto& emission : emissions) {
        if (halted) {
            return;
        }
        const long next = emission.direction == Direction::Downstream ? index + 1 : index - 1;
        route(emission.frame, emission.direction, next);
    }
}

void Pipeline::Core::terminate(const PipelineTerminated& error) {
    terminated = true;
    halted = true;
    {
        std::lock_guard<std::mutex> lock(queue->mutex);
        queue->closed = true;
        queue->items.clear();
    }
    queue->cv.notify_all();
    logging::error("Pipeline terminated",
                   {kv("stage", error.stage()), kv("error", error.what())});
    stop_stages();
    if (on_terminated) {
        on_terminated(error);
    }
}

void Pipeline::Core::stop_stages() {
    if (stages_stopped.exchange(true)) {
        return;
    }
    for (auto& stage : stages) {
        stage->stop();
    }
}

Pipeline::Pipeline(std::vector<std::shared_ptr<Stage>> stages)
    : core_(std::make_shared<Core>()) {
    core_->stages = std::move(stages);
    for (std::size_t i = 0; i < core_->stages.size(); ++i) {
        if (!core_->stages[i]) {
            throw std::invalid_argument("pipeline stage must not be null");
        }
        core_->stages[i]->attach(FrameEmitter(core_->queue, i));
    }
}

Pipeline::~Pipeline() {
    stop();
}

void Pipeline::start(Sink sink, TerminatedHandler on_terminated) {
    if (started_.exchange(true)) {
        return;
    }
    core_->sink = std::move(sink);
    core_->on_terminated = std::move(on_terminated);
    worker_ = std::thread([core = core_]() { core->run_loop(); });
}

void Pipeline::push(Frame frame, Direction direction) {
    const long entry = direction == Direction::Downstream
                           ? 0
                           : static_cast<long>(core_->stages.size()) - 1;
    if (!core_->queue->enqueue(std::move(frame), direction, entry)) {
        logging::debug("Frame dropped (pipeline stopped)",
                       {kv("direction", to_string(direction))});
    }
}

void Pipeline::stop() {
    const bool on_worker =
        worker_.joinable() && worker_.get_id() == std::this_thread::get_id();
    {
        std::lock_guard<std::mutex> lock(core_->queue->mutex);
        if (on_worker) {
            core_->queue->closed = true;
            core_->queue->items.clear();
        } else {
            core_->queue->stopping = true;
        }
    }
    if (on_worker) {
        core_->halted = true;
    }
    core_->queue->cv.notify_all();
    if (worker_.joinable()) {
        if (on_worker) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    core_->stop_stages();
}

bool Pipeline::terminated() const {
    return core_->terminated.load();
}

std::size_t Pipeline::size() const {
    return core_->stages.size();
}

}
