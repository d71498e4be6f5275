#include "order_voice/utils/async.hpp"

#include <exception>
#include <thread>

#include "order_voice/logging.hpp"

namespace order_voice::utils {

void run_async(std::function<void()> task, std::string label) {
    std::thread worker([task = std::move(task), label = std::move(label)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Async task failed", {kv("task", label), kv("error", ex.what())});
        }
    });
    worker.detach();
}

SerialExecutor::SerialExecutor(std::string label)
    : label_(std::move(label)),
      state_(std::make_shared<State>()) {}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(std::function<void()> task) {
    bool start_worker = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed) {
            return false;
        }
        state_->tasks.push_back(std::move(task));
        if (!state_->running) {
            state_->running = true;
            start_worker = true;
        }
    }
    if (start_worker) {
        run_async([state = state_, label = label_]() { drain(state, label); }, label_);
    }
    return true;
}

void SerialExecutor::shutdown() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->closed = true;
    state_->tasks.clear();
    if (!state_->running) {
        state_->idle.notify_all();
    }
}

void SerialExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->idle.wait(lock, [this]() { return !state_->running && state_->tasks.empty(); });
}

std::size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->tasks.size() + (state_->running ? 1 : 0);
}

void SerialExecutor::drain(const std::shared_ptr<State>& state, const std::string& label) {
    while (true) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->tasks.empty()) {
                state->running = false;
                state->idle.notify_all();
                return;
            }
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Serial task failed", {kv("task", label), kv("error", ex.what())});
        }
    }
}

}
