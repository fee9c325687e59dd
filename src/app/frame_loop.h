#pragma once

#include <chrono>
#include <functional>
#include <thread>

#include "render/framebuffer.h"

namespace marcher {

// Where finished frames go. Implementations decide when the loop has to stop.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Pumps pending window or input events. Called on every loop iteration.
    virtual void poll() = 0;

    virtual void present(const Framebuffer& frame) = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
    [[nodiscard]] virtual bool exitRequested() const = 0;
};

// Lets a frame through once `interval` has passed since the previous one (or since construction).
class FramePacer {
public:
    using Clock = std::chrono::steady_clock;

    explicit FramePacer(std::chrono::milliseconds interval)
        : interval_(interval), last_(Clock::now()) {}

    [[nodiscard]] bool ready() {
        const Clock::time_point now = Clock::now();
        if (now - last_ < interval_) {
            return false;
        }
        last_ = now;
        return true;
    }

private:
    std::chrono::milliseconds interval_;
    Clock::time_point last_;
};

/**
 * Drives the render/present cycle until the sink closes.
 *
 * Between frames the loop spins on the pacer instead of sleeping. The sink is
 * checked before every frame, so a close or exit request stops the loop
 * without starting another render; a frame already being rendered is always
 * finished and presented.
 *
 * Returns the number of frames presented.
 */
inline int runFrameLoop(
    FrameSink& sink,
    Framebuffer& framebuffer,
    const std::function<void(Framebuffer&)>& renderFrame,
    std::chrono::milliseconds interval) {
    FramePacer pacer(interval);
    int frames = 0;

    while (true) {
        sink.poll();
        if (!sink.isOpen() || sink.exitRequested()) {
            break;
        }

        if (!pacer.ready()) {
            std::this_thread::yield();
            continue;
        }

        renderFrame(framebuffer);
        sink.present(framebuffer);
        ++frames;
    }

    return frames;
}

}  // namespace marcher
