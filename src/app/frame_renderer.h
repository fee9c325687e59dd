#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

#include "app/options.h"
#include "render/framebuffer.h"
#include "render/gpu_renderer.h"
#include "render/renderer.h"
#include "sdf/sdf.h"

namespace marcher {

// Resolves the runtime backend from the user's request and the build's capabilities.
// Returns false when the request cannot be honored at all.
[[nodiscard]] inline bool resolveBackend(
    BackendChoice choice,
    bool gpuCompiled,
    bool& useGpu,
    std::string& errorMessage) {
    useGpu = false;
    if (choice == BackendChoice::Auto) {
        useGpu = gpuCompiled;
    } else if (choice == BackendChoice::Gpu) {
        if (!gpuCompiled) {
            errorMessage = "GPU backend requested, but this binary was built without CUDA support. "
                           "Rebuild with CUDA toolkit installed, or run with --backend cpu.";
            return false;
        }
        useGpu = true;
    }
    return true;
}

/**
 * Produces one frame per call on the selected backend.
 *
 * The GPU kernel always marches the built-in scene; the CPU path marches
 * whatever `scene` is passed in. In auto mode a failing GPU dispatch switches
 * the renderer to the CPU for this and every later frame. With an explicit
 * GPU request the failure is thrown instead.
 */
class FrameRenderer {
public:
    FrameRenderer(const Sdf& scene, const RenderSettings& settings, BackendChoice choice, bool useGpu, bool quiet)
        : scene_(scene), renderer_(settings), choice_(choice), useGpu_(useGpu), quiet_(quiet) {}

    void operator()(Framebuffer& frame) {
        if (useGpu_) {
            std::string gpuError;
            if (renderWithGpu(renderer_.settings(), frame, gpuError)) {
                return;
            }

            if (choice_ == BackendChoice::Gpu) {
                throw std::runtime_error("GPU render failed: " + gpuError);
            }

            if (!quiet_) {
                std::cerr << "GPU render unavailable (" << gpuError << "), falling back to CPU.\n";
            }
            useGpu_ = false;
        }

        renderer_.render(scene_, frame);
    }

    [[nodiscard]] bool usingGpu() const { return useGpu_; }

private:
    const Sdf& scene_;
    Renderer renderer_;
    BackendChoice choice_;
    bool useGpu_;
    bool quiet_;
};

}  // namespace marcher
