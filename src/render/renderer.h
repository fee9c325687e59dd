#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "render/camera.h"
#include "render/framebuffer.h"
#include "render/shading.h"
#include "render/sphere_tracer.h"
#include "sdf/sdf.h"

namespace marcher {

// hardware_concurrency() may report 0 when the count is unknown.
[[nodiscard]] inline int defaultThreadCount() {
    return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

struct RenderSettings {
    int width = 600;
    int height = 600;
    double fovDeg = 64.0;
    int maxSteps = 50;
    double epsilon = 0.001;
    int threadCount = defaultThreadCount();
    PointLight light;

    [[nodiscard]] CameraSettings cameraSettings() const {
        CameraSettings camera;
        camera.fovDeg = fovDeg;
        return camera;
    }

    [[nodiscard]] TraceSettings traceSettings() const {
        TraceSettings trace;
        trace.maxSteps = maxSteps;
        trace.epsilon = epsilon;
        return trace;
    }
};

class Renderer {
public:
    explicit Renderer(RenderSettings settings)
        : settings_(std::move(settings)),
          camera_(settings_.width, settings_.height, settings_.cameraSettings()) {
        if (settings_.threadCount <= 0) {
            settings_.threadCount = 1;
        }
    }

    // Sphere traces every pixel of the frame. Each pixel writes only its own slot.
    void render(
        const Sdf& scene,
        Framebuffer& output,
        const std::function<void(int, int)>& onProgress = {}) const {
        if (output.width() != settings_.width || output.height() != settings_.height) {
            throw std::invalid_argument("Framebuffer size does not match render settings");
        }

        std::atomic<int> nextRow(0);
        std::atomic<int> rowsDone(0);
        std::mutex progressMutex;

        const int workerCount = std::min(settings_.threadCount, settings_.height);
        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(workerCount));

        for (int threadIndex = 0; threadIndex < workerCount; ++threadIndex) {
            workers.emplace_back([&]() {
                while (true) {
                    const int y = nextRow.fetch_add(1);
                    if (y >= settings_.height) {
                        break;
                    }

                    for (int x = 0; x < settings_.width; ++x) {
                        output.setPixel(x, y, shadePixel(scene, x, y));
                    }

                    const int completed = rowsDone.fetch_add(1) + 1;
                    if (onProgress) {
                        std::lock_guard<std::mutex> lock(progressMutex);
                        onProgress(completed, settings_.height);
                    }
                }
            });
        }

        for (auto& worker : workers) {
            worker.join();
        }
    }

    [[nodiscard]] std::uint32_t shadePixel(const Sdf& scene, int x, int y) const {
        const Ray ray = camera_.primaryRay(x, y);
        const TraceResult trace = sphereTrace(scene, ray, settings_.traceSettings());
        if (!trace.hit) {
            return kMissColor;
        }

        const Vec3 normal = estimateNormal(scene, trace.position, settings_.epsilon);
        return packColor(shadeLambert(trace.position, normal, settings_.light), 255);
    }

    [[nodiscard]] const RenderSettings& settings() const {
        return settings_;
    }

private:
    RenderSettings settings_;
    Camera camera_;
};

}  // namespace marcher
