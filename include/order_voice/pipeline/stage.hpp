#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "order_voice/pipeline/frame.hpp"

namespace order_voice {

namespace detail {
struct PipelineQueue;
}

// Injects frames into a running pipeline as if the owning stage had emitted
// them. Copies stay valid after the pipeline is gone; emissions are dropped then.
class FrameEmitter {
public:
    FrameEmitter() = default;

    void emit(Frame frame, Direction direction) const;
    bool attached() const;

private:
    friend class Pipeline;

    FrameEmitter(std::weak_ptr<detail::PipelineQueue> queue, std::size_t origin);

    std::weak_ptr<detail::PipelineQueue> queue_;
    std::size_t origin_ = 0;
};

class Stage {
public:
    virtual ~Stage() = default;

    virtual std::string name() const = 0;

    // Returns the frames to pass on. A stage forwards every frame kind it
    // does not handle unchanged, in the direction it arrived.
    virtual Emissions handle(const Frame& frame, Direction direction) = 0;

    // Called once when the pipeline stops or terminates.
    virtual void stop() {}

    void attach(FrameEmitter emitter) { emitter_ = std::move(emitter); }

protected:
    const FrameEmitter& emitter() const { return emitter_; }

    static Emissions forward(const Frame& frame, Direction direction) {
        return {{frame, direction}};
    }

private:
    FrameEmitter emitter_;
};

}
