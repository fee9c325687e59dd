#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "render/camera.h"
#include "render/framebuffer.h"
#include "render/gpu_march.h"
#include "render/gpu_renderer.h"
#include "render/renderer.h"
#include "scene/scene.h"

namespace marcher {
namespace {

MarchInstruction makeInstruction(const Vec3& origin, const Vec3& direction) {
    MarchInstruction instruction;
    instruction.origin = toGpuVec3(origin);
    instruction.direction = toGpuVec3(direction);
    return instruction;
}

std::vector<MarchResult> marchOnHost(
    const std::vector<MarchInstruction>& instructions,
    const MarchParams& params = MarchParams{}) {
    std::vector<MarchResult> results;
    results.reserve(instructions.size());
    for (const MarchInstruction& instruction : instructions) {
        results.push_back(marchElement(instruction, params));
    }
    return results;
}

TEST(GpuMarchTest, RecordLayoutMatchesKernelContract) {
    EXPECT_EQ(sizeof(MarchInstruction), 24u);
    EXPECT_EQ(sizeof(MarchResult), 16u);
    EXPECT_EQ(offsetof(MarchInstruction, direction), 12u);
    EXPECT_EQ(offsetof(MarchResult, normal), 4u);
}

TEST(GpuMarchTest, KernelSceneTracksHostScene) {
    const SdfPtr scene = makeDefaultScene();
    for (int ix = -5; ix <= 5; ++ix) {
        for (int iy = -4; iy <= 7; ++iy) {
            for (int iz = -5; iz <= 5; ++iz) {
                const Point3 p(ix * 0.8, iy * 0.8, iz * 0.8);
                EXPECT_NEAR(gpuSceneDistance(toGpuVec3(p)), scene->distance(p), 1e-4) << p;
            }
        }
    }
}

TEST(GpuMarchTest, AxisRayHitsNearSurface) {
    const MarchResult result = marchElement(makeInstruction(Vec3(0.0, 0.0, -10.0), Vec3(0.0, 0.0, 1.0)), MarchParams{});
    ASSERT_TRUE(isHit(result));

    const GpuVec3 position = GpuVec3{0.0f, 0.0f, -10.0f} + GpuVec3{0.0f, 0.0f, 1.0f} * result.distance;
    EXPECT_LT(std::fabs(gpuSceneDistance(position)), 0.01f);

    const Vec3 normal = fromGpuVec3(result.normal);
    EXPECT_NEAR(normal.length(), 1.0, 1e-4);
    EXPECT_LT(normal.z(), 0.0);
}

TEST(GpuMarchTest, RayPointingAwayMisses) {
    const MarchResult result = marchElement(makeInstruction(Vec3(0.0, 0.0, -10.0), Vec3(0.0, 0.0, -1.0)), MarchParams{});
    EXPECT_FALSE(isHit(result));
    EXPECT_EQ(result.distance, kGpuMissDistance);
    EXPECT_EQ(result.normal.x, 0.0f);
    EXPECT_EQ(result.normal.y, 0.0f);
    EXPECT_EQ(result.normal.z, 0.0f);
}

TEST(GpuMarchTest, DispatchSizeRoundsUpToWholeWorkgroups) {
    EXPECT_EQ(paddedDispatchSize(0), 0u);
    EXPECT_EQ(paddedDispatchSize(1), 64u);
    EXPECT_EQ(paddedDispatchSize(64), 64u);
    EXPECT_EQ(paddedDispatchSize(65), 128u);
    EXPECT_EQ(paddedDispatchSize(600 * 600), 360000u);
}

TEST(GpuMarchTest, InstructionsFollowFramebufferOrder) {
    const Camera camera(10, 7);
    const std::vector<MarchInstruction> instructions = buildMarchInstructions(camera);
    ASSERT_EQ(instructions.size(), 128u);

    for (int y = 0; y < 7; ++y) {
        for (int x = 0; x < 10; ++x) {
            const Ray ray = camera.primaryRay(x, y);
            const MarchInstruction& instruction = instructions[static_cast<std::size_t>(y * 10 + x)];
            EXPECT_EQ(instruction.origin.z, static_cast<float>(ray.origin.z()));
            EXPECT_EQ(instruction.direction.x, static_cast<float>(ray.direction.x()));
            EXPECT_EQ(instruction.direction.y, static_cast<float>(ray.direction.y()));
            EXPECT_EQ(instruction.direction.z, static_cast<float>(ray.direction.z()));
        }
    }

    for (std::size_t i = 70; i < instructions.size(); ++i) {
        EXPECT_EQ(instructions[i].direction.x, 0.0f);
        EXPECT_EQ(instructions[i].direction.y, 0.0f);
        EXPECT_EQ(instructions[i].direction.z, 0.0f);
    }
}

TEST(GpuMarchTest, HostShadingUsesComputedLighting) {
    std::vector<MarchInstruction> instructions(2);
    instructions[0] = makeInstruction(Vec3(0.0, 0.0, -10.0), Vec3(0.0, 0.0, 1.0));
    instructions[1] = makeInstruction(Vec3(0.0, 0.0, -10.0), Vec3(0.0, 1.0, 0.0));

    std::vector<MarchResult> results(2);
    results[0].distance = 7.0f;
    results[0].normal = GpuVec3{0.0f, 0.0f, -1.0f};

    const PointLight light;
    Framebuffer frame(2, 1);
    frame.fill(0xFFFFFFFFu);
    shadeMarchResults(instructions, results, light, frame);

    const std::uint32_t expected = packColor(
        shadeLambert(Point3(0.0, 0.0, -3.0), Vec3(0.0, 0.0, -1.0), light), 255);
    EXPECT_EQ(frame.getPixel(0, 0), expected);
    EXPECT_NE(frame.getPixel(0, 0), packColor(Color(1.0, 0.0, 0.0), 255));
    EXPECT_EQ(frame.getPixel(1, 0), kMissColor);
}

TEST(GpuMarchTest, HostShadingRejectsShortBuffers) {
    const std::vector<MarchInstruction> instructions(3);
    const std::vector<MarchResult> results(2);
    Framebuffer frame(3, 1);
    EXPECT_THROW(shadeMarchResults(instructions, results, PointLight{}, frame), std::invalid_argument);
}

TEST(GpuMarchTest, HostEvaluatedKernelRendersSilhouette) {
    const Camera camera(3, 3);
    const std::vector<MarchInstruction> instructions = buildMarchInstructions(camera);
    const std::vector<MarchResult> results = marchOnHost(instructions);

    Framebuffer frame(3, 3);
    shadeMarchResults(instructions, results, PointLight{}, frame);

    EXPECT_NE(frame.getPixel(1, 1), kMissColor);
    EXPECT_EQ(frame.getPixel(0, 0), kMissColor);
    EXPECT_EQ(frame.getPixel(2, 0), kMissColor);
    EXPECT_EQ(frame.getPixel(0, 2), kMissColor);
    EXPECT_EQ(frame.getPixel(2, 2), kMissColor);
}

TEST(GpuMarchTest, MarchParamsFollowRenderSettings) {
    RenderSettings settings;
    settings.maxSteps = 7;
    settings.epsilon = 0.01;

    const MarchParams params = marchParams(settings);
    EXPECT_EQ(params.maxSteps, 7);
    EXPECT_FLOAT_EQ(params.epsilon, 0.01f);

    const MarchParams defaults = marchParams(RenderSettings{});
    EXPECT_EQ(defaults.maxSteps, kGpuMaxSteps);
    EXPECT_FLOAT_EQ(defaults.epsilon, kGpuEpsilon);
}

TEST(GpuMarchTest, SingleStepBudgetMissesCenterLikeCpu) {
    RenderSettings settings;
    settings.width = 3;
    settings.height = 3;
    settings.maxSteps = 1;
    settings.threadCount = 1;

    const Camera camera(settings.width, settings.height, settings.cameraSettings());
    const std::vector<MarchInstruction> instructions = buildMarchInstructions(camera);
    const std::vector<MarchResult> results = marchOnHost(instructions, marchParams(settings));

    Framebuffer gpuFrame(3, 3);
    shadeMarchResults(instructions, results, settings.light, gpuFrame);
    EXPECT_EQ(gpuFrame.getPixel(1, 1), kMissColor);

    const SdfPtr scene = makeDefaultScene();
    Framebuffer cpuFrame(3, 3);
    Renderer(settings).render(*scene, cpuFrame);
    EXPECT_EQ(cpuFrame.getPixel(1, 1), kMissColor);
}

TEST(GpuMarchTest, LooserEpsilonStopsEarlier) {
    const MarchInstruction instruction = makeInstruction(Vec3(0.0, 0.0, -10.0), Vec3(0.0, 0.0, 1.0));

    MarchParams loose;
    loose.epsilon = 0.1f;
    const MarchResult tight = marchElement(instruction, MarchParams{});
    const MarchResult coarse = marchElement(instruction, loose);

    ASSERT_TRUE(isHit(tight));
    ASSERT_TRUE(isHit(coarse));
    EXPECT_LE(coarse.distance, tight.distance);
    EXPECT_LT(gpuSceneDistance(GpuVec3{0.0f, 0.0f, -10.0f + coarse.distance}), 0.1f);
}

TEST(GpuMarchTest, DispatchProducesSurfaceHitsOrReportsUnavailable) {
    const Camera camera(16, 8);
    const std::vector<MarchInstruction> instructions = buildMarchInstructions(camera);

    std::vector<MarchResult> results;
    std::string error;
    const bool dispatched = dispatchMarch(instructions, MarchParams{}, results, error);

    if (!gpuBackendCompiled()) {
        EXPECT_FALSE(dispatched);
        EXPECT_FALSE(error.empty());
        return;
    }

    ASSERT_TRUE(dispatched) << error;
    ASSERT_EQ(results.size(), instructions.size());

    // Device float math may contract differently, so only hit quality is compared, not bits.
    for (std::size_t i = 0; i < static_cast<std::size_t>(16 * 8); ++i) {
        if (!isHit(results[i])) {
            continue;
        }
        const GpuVec3 position = instructions[i].origin + instructions[i].direction * results[i].distance;
        EXPECT_LT(std::fabs(gpuSceneDistance(position)), 0.01f) << "element " << i;
    }

    const std::size_t center = static_cast<std::size_t>(4 * 16 + 8);
    EXPECT_TRUE(isHit(results[center]));
    EXPECT_TRUE(isHit(marchElement(instructions[center], MarchParams{})));
}

TEST(GpuMarchTest, RenderWithGpuRejectsMismatchedFramebuffer) {
    RenderSettings settings;
    settings.width = 8;
    settings.height = 8;
    Framebuffer frame(4, 4);
    std::string error;
    EXPECT_FALSE(renderWithGpu(settings, frame, error));
    EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace marcher
