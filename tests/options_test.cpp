#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "app/options.h"

namespace marcher {
namespace {

bool parse(const std::vector<const char*>& args, OptionSet set, AppOptions& options, std::string& error) {
    std::vector<const char*> argv;
    argv.push_back("marcher");
    argv.insert(argv.end(), args.begin(), args.end());
    return parseOptions(static_cast<int>(argv.size()), argv.data(), set, options, error);
}

TEST(OptionsTest, DefaultsMatchFixedSetup) {
    AppOptions options;
    std::string error;
    ASSERT_TRUE(parse({}, OptionSet::Headless, options, error));

    EXPECT_EQ(options.render.width, 600);
    EXPECT_EQ(options.render.height, 600);
    EXPECT_DOUBLE_EQ(options.render.fovDeg, 64.0);
    EXPECT_EQ(options.render.maxSteps, 50);
    EXPECT_DOUBLE_EQ(options.render.epsilon, 0.001);
    EXPECT_EQ(options.intervalMs, 200);
    EXPECT_EQ(options.backend, BackendChoice::Auto);
    EXPECT_EQ(options.frames, 1);
    EXPECT_FALSE(options.showHelp);
}

TEST(OptionsTest, ParsesAllHeadlessFlags) {
    AppOptions options;
    std::string error;
    ASSERT_TRUE(parse(
        {"--width", "800", "--height", "450", "--fov", "90", "--steps", "80", "--threads", "3",
         "--interval-ms", "0", "--backend", "cpu", "--frames", "4", "--output", "frames/x.ppm", "--quiet"},
        OptionSet::Headless, options, error)) << error;

    EXPECT_EQ(options.render.width, 800);
    EXPECT_EQ(options.render.height, 450);
    EXPECT_DOUBLE_EQ(options.render.fovDeg, 90.0);
    EXPECT_EQ(options.render.maxSteps, 80);
    EXPECT_EQ(options.render.threadCount, 3);
    EXPECT_EQ(options.intervalMs, 0);
    EXPECT_EQ(options.backend, BackendChoice::Cpu);
    EXPECT_EQ(options.frames, 4);
    EXPECT_EQ(options.outputPath, "frames/x.ppm");
    EXPECT_TRUE(options.quiet);
}

TEST(OptionsTest, HelpStopsParsing) {
    AppOptions options;
    std::string error;
    ASSERT_TRUE(parse({"--help", "--bogus"}, OptionSet::Viewer, options, error));
    EXPECT_TRUE(options.showHelp);
}

TEST(OptionsTest, RejectsMalformedValues) {
    const std::vector<std::vector<const char*>> bad = {
        {"--width", "12px"},
        {"--width", "0"},
        {"--height", "-4"},
        {"--height", ""},
        {"--fov", "180"},
        {"--fov", "abc"},
        {"--steps", "0"},
        {"--threads", "0"},
        {"--interval-ms", "-1"},
        {"--backend", "vulkan"},
        {"--frames", "0"},
        {"--width", "99999999999999999999"},
    };
    for (const auto& args : bad) {
        AppOptions options;
        std::string error;
        EXPECT_FALSE(parse(args, OptionSet::Headless, options, error)) << args[0] << " " << args[1];
        EXPECT_FALSE(error.empty());
    }
}

TEST(OptionsTest, MissingValueIsReported) {
    AppOptions options;
    std::string error;
    EXPECT_FALSE(parse({"--width"}, OptionSet::Headless, options, error));
    EXPECT_EQ(error, "Missing value for --width");
}

TEST(OptionsTest, HeadlessFlagsAreUnknownToViewer) {
    AppOptions options;
    std::string error;
    EXPECT_FALSE(parse({"--frames", "3"}, OptionSet::Viewer, options, error));
    EXPECT_EQ(error, "Unknown option: --frames");
}

TEST(OptionsTest, BackendNamesRoundTrip) {
    for (const BackendChoice choice : {BackendChoice::Auto, BackendChoice::Cpu, BackendChoice::Gpu}) {
        BackendChoice parsed = BackendChoice::Auto;
        ASSERT_TRUE(readBackendArg(backendName(choice), parsed));
        EXPECT_EQ(parsed, choice);
    }
}

}  // namespace
}  // namespace marcher
