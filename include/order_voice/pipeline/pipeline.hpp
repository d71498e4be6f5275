#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "order_voice/pipeline/frame.hpp"
#include "order_voice/pipeline/stage.hpp"

namespace order_voice {

class PipelineTerminated : public std::runtime_error {
public:
    PipelineTerminated(std::string stage, const std::string& reason)
        : std::runtime_error("stage " + stage + " failed: " + reason),
          stage_(std::move(stage)) {}

    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

// Runs frames through an ordered list of stages on a dedicated worker thread.
// Downstream frames visit stages first to last, upstream frames last to first.
// Frames that leave either end are handed to the sink.
class Pipeline {
public:
    using Sink = std::function<void(const Frame&, Direction)>;
    using TerminatedHandler = std::function<void(const PipelineTerminated&)>;

    explicit Pipeline(std::vector<std::shared_ptr<Stage>> stages);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void start(Sink sink = nullptr, TerminatedHandler on_terminated = nullptr);

    // Downstream frames enter at the first stage, upstream frames at the last.
    void push(Frame frame, Direction direction = Direction::Downstream);

    // Processes what is already queued, then joins the worker and stops stages.
    // Called from the worker itself (a sink or termination handler), queued
    // frames are discarded and the worker finishes on its own after the
    // current frame; the Pipeline may be destroyed right away.
    void stop();

    bool terminated() const;
    std::size_t size() const;

private:
    struct Core;

    std::shared_ptr<Core> core_;
    std::thread worker_;
    std::atomic<bool> started_{false};
};

}
