#pragma once

#include <string>
#include <vector>

#include "render/camera.h"
#include "render/framebuffer.h"
#include "render/gpu_march.h"
#include "render/renderer.h"

namespace marcher {

#if !defined(MARCHER_HAS_CUDA)
#define MARCHER_HAS_CUDA 0
#endif

[[nodiscard]] inline bool gpuBackendCompiled() {
    return MARCHER_HAS_CUDA == 1;
}

[[nodiscard]] inline std::string gpuBackendLabel() {
#if MARCHER_HAS_CUDA
    return "cuda";
#else
    return "cpu-only build";
#endif
}

[[nodiscard]] inline MarchParams marchParams(const RenderSettings& settings) {
    MarchParams params;
    params.maxSteps = settings.maxSteps;
    params.epsilon = static_cast<float>(settings.epsilon);
    return params;
}

// Uploads the instructions, runs the march kernel over whole workgroups, blocks
// until it finishes and downloads one result per instruction.
bool dispatchMarch(
    const std::vector<MarchInstruction>& instructions,
    const MarchParams& params,
    std::vector<MarchResult>& results,
    std::string& errorMessage);

#if !MARCHER_HAS_CUDA
inline bool dispatchMarch(
    const std::vector<MarchInstruction>&,
    const MarchParams&,
    std::vector<MarchResult>&,
    std::string& errorMessage) {
    errorMessage = "GPU backend is unavailable in this build. Install CUDA toolkit and rebuild.";
    return false;
}
#endif

// GPU counterpart of Renderer::render: ray setup and shading stay on the host.
[[nodiscard]] inline bool renderWithGpu(
    const RenderSettings& settings,
    Framebuffer& output,
    std::string& errorMessage) {
    if (output.width() != settings.width || output.height() != settings.height) {
        errorMessage = "Framebuffer size does not match render settings";
        return false;
    }

    const Camera camera(settings.width, settings.height, settings.cameraSettings());
    const std::vector<MarchInstruction> instructions = buildMarchInstructions(camera);

    std::vector<MarchResult> results;
    if (!dispatchMarch(instructions, marchParams(settings), results, errorMessage)) {
        return false;
    }

    shadeMarchResults(instructions, results, settings.light, output);
    return true;
}

}  // namespace marcher
