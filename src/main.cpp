#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "app/frame_loop.h"
#include "app/frame_renderer.h"
#include "app/options.h"
#include "app/ppm_frame_sink.h"
#include "render/framebuffer.h"
#include "render/gpu_renderer.h"
#include "scene/scene.h"

int main(int argc, char** argv) {
    using namespace marcher;

    AppOptions options;
    std::string parseError;
    if (!parseOptions(argc, argv, OptionSet::Headless, options, parseError)) {
        std::cerr << parseError << "\n";
        std::cout << usageText(OptionSet::Headless);
        return 1;
    }
    if (options.showHelp) {
        std::cout << usageText(OptionSet::Headless);
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
        if (!options.quiet) {
            std::cout << "Rendering " << settings.width << "x" << settings.height
                      << " | fov=" << settings.fovDeg
                      << " | steps=" << settings.maxSteps
                      << " | threads=" << settings.threadCount
                      << " | backend=" << (useGpu ? "gpu" : "cpu")
                      << " (requested " << backendName(options.backend) << ")"
                      << " | frames=" << options.frames
                      << "\n";
            if (options.backend == BackendChoice::Auto) {
                std::cout << "Backend auto-detect: " << gpuBackendLabel() << "\n";
            }
        }

        const SdfPtr scene = makeDefaultScene();
        FrameRenderer renderFrame(*scene, settings, options.backend, useGpu, options.quiet);
        Framebuffer framebuffer(settings.width, settings.height);
        PpmFrameSink sink(options.outputPath, options.frames, options.quiet);

        const auto start = std::chrono::steady_clock::now();
        const int frames = runFrameLoop(
            sink,
            framebuffer,
            [&](Framebuffer& frame) { renderFrame(frame); },
            std::chrono::milliseconds(options.intervalMs));
        const auto end = std::chrono::steady_clock::now();
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        if (!options.quiet) {
            std::cout << "Rendered " << frames << " frame(s) in " << elapsedMs << " ms on "
                      << (renderFrame.usingGpu() ? "gpu" : "cpu") << "\n";
            std::cout << "Wrote image to: " << options.outputPath << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
