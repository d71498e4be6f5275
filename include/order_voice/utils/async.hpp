#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace order_voice {
namespace utils {

// Runs `task` on a detached thread. Exceptions escaping the task are logged
// under `label` and do not terminate the process.
void run_async(std::function<void()> task, std::string label = "async");

// Runs posted tasks one at a time, in order, on a detached worker that
// exists only while there is work. Tasks must not capture the owner.
class SerialExecutor {
public:
    explicit SerialExecutor(std::string label);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // Returns false once shut down.
    bool post(std::function<void()> task);
    // Drops queued tasks; a task already running completes on its own.
    void shutdown();
    // Blocks until nothing is queued or running.
    void wait_idle();
    std::size_t pending() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable idle;
        std::deque<std::function<void()>> tasks;
        bool running = false;
        bool closed = false;
    };

    static void drain(const std::shared_ptr<State>& state, const std::string& label);

    std::string label_;
    std::shared_ptr<State> state_;
};

}
}
