#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "app/frame_loop.h"
#include "app/frame_renderer.h"
#include "app/options.h"
#include "render/framebuffer.h"
#include "render/gpu_renderer.h"
#include "scene/scene.h"
#include "viewer/glfw_frame_sink.h"

int main(int argc, char** argv) {
    using namespace marcher;

    AppOptions options;
    std::string parseError;
    if (!parseOptions(argc, argv, OptionSet::Viewer, options, parseError)) {
        std::cerr << parseError << "\n";
        std::cout << usageText(OptionSet::Viewer);
        return 1;
    }
    if (options.showHelp) {
        std::cout << usageText(OptionSet::Viewer);
        return 0;
    }

    try {
        bool useGpu = false;
        std::string backendError;
        if (!resolveBackend(options.backend, gpuBackendCompiled(), useGpu, backendError)) {
            std::cerr << backendError << "\n";
            return 1;
        }

        const RenderSettings& settings = options.render;
        GlfwFrameSink window(settings.width, settings.height, "SDF Sphere Tracer - Esc to exit");

        const SdfPtr scene = makeDefaultScene();
        FrameRenderer renderer(*scene, settings, options.backend, useGpu, false);
        Framebuffer framebuffer(settings.width, settings.height);

        std::cout << "Viewer running on " << (useGpu ? "gpu" : "cpu") << ".\n";

        const int frames = runFrameLoop(
            window,
            framebuffer,
            [&](Framebuffer& frame) {
                const auto start = std::chrono::steady_clock::now();
                renderer(frame);
                const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start).count();

                window.setTitle(
                    "SDF Sphere Tracer | " + std::string(renderer.usingGpu() ? "gpu" : "cpu") +
                    " | frame=" + std::to_string(elapsedMs) + " ms");
            },
            std::chrono::milliseconds(options.intervalMs));

        std::cout << "Presented " << frames << " frame(s).\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
