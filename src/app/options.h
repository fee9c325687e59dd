#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "render/renderer.h"

namespace marcher {

// User-facing backend selection mode.
enum class BackendChoice {
    Auto,
    Cpu,
    Gpu,
};

enum class OptionSet {
    Headless,
    Viewer,
};

struct AppOptions {
    RenderSettings render;
    BackendChoice backend = BackendChoice::Auto;
    int intervalMs = 200;

    // Headless only.
    int frames = 1;
    std::string outputPath = "out/marcher.ppm";
    bool quiet = false;

    bool showHelp = false;
};

inline bool readIntArg(const std::string& value, int& out) {
    try {
        std::size_t idx = 0;
        const int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool readDoubleArg(const std::string& value, double& out) {
    try {
        std::size_t idx = 0;
        const double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool readBackendArg(const std::string& value, BackendChoice& out) {
    if (value == "auto") {
        out = BackendChoice::Auto;
        return true;
    }
    if (value == "cpu") {
        out = BackendChoice::Cpu;
        return true;
    }
    if (value == "gpu") {
        out = BackendChoice::Gpu;
        return true;
    }
    return false;
}

[[nodiscard]] inline const char* backendName(BackendChoice choice) {
    switch (choice) {
        case BackendChoice::Auto:
            return "auto";
        case BackendChoice::Cpu:
            return "cpu";
        case BackendChoice::Gpu:
            return "gpu";
    }
    return "auto";
}

[[nodiscard]] inline std::string usageText(OptionSet set) {
    std::string text;
    text += "SDF Sphere Tracer\n";
    text += "Usage:\n";
    text += set == OptionSet::Headless ? "  marcher [options]\n\n" : "  marcher_viewer [options]\n\n";
    text += "Options:\n";
    text += "  --width <int>        Frame width (default: 600)\n";
    text += "  --height <int>       Frame height (default: 600)\n";
    text += "  --fov <float>        Field of view in degrees (default: 64)\n";
    text += "  --steps <int>        Sphere tracing step budget (default: 50)\n";
    text += "  --threads <int>      CPU worker threads (default: hardware concurrency)\n";
    text += "  --interval-ms <int>  Minimum time between frames (default: 200)\n";
    text += "  --backend <mode>     Marching backend: auto | cpu | gpu (default: auto)\n";
    if (set == OptionSet::Headless) {
        text += "  --frames <int>       Frames to render before exiting (default: 1)\n";
        text += "  --output <path>      PPM path for the last frame (default: out/marcher.ppm)\n";
        text += "  --quiet              Minimize console output\n";
    } else {
        text += "\n  Esc or closing the window quits.\n";
    }
    text += "  --help               Show this message\n";
    return text;
}

/**
 * Parses argv into `options`, failing fast on the first malformed value.
 *
 * On failure `errorMessage` names the offending flag and the return value is
 * false. `--help` succeeds and sets `options.showHelp`; parsing stops there.
 */
[[nodiscard]] inline bool parseOptions(
    int argc,
    const char* const* argv,
    OptionSet set,
    AppOptions& options,
    std::string& errorMessage) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto nextValue = [&](std::string& value) -> bool {
            if (i + 1 >= argc) {
                errorMessage = "Missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };

        auto invalid = [&]() -> bool {
            if (errorMessage.empty()) {
                errorMessage = "Invalid " + arg + " value";
            }
            return false;
        };

        std::string value;

        if (arg == "--help") {
            options.showHelp = true;
            return true;
        }
        if (arg == "--width") {
            if (!nextValue(value) || !readIntArg(value, options.render.width) || options.render.width < 1) {
                return invalid();
            }
            continue;
        }
        if (arg == "--height") {
            if (!nextValue(value) || !readIntArg(value, options.render.height) || options.render.height < 1) {
                return invalid();
            }
            continue;
        }
        if (arg == "--fov") {
            if (!nextValue(value) || !readDoubleArg(value, options.render.fovDeg)
                || options.render.fovDeg <= 0.0 || options.render.fovDeg >= 180.0) {
                return invalid();
            }
            continue;
        }
        if (arg == "--steps") {
            if (!nextValue(value) || !readIntArg(value, options.render.maxSteps) || options.render.maxSteps < 1) {
                return invalid();
            }
            continue;
        }
        if (arg == "--threads") {
            if (!nextValue(value) || !readIntArg(value, options.render.threadCount) || options.render.threadCount < 1) {
                return invalid();
            }
            continue;
        }
        if (arg == "--interval-ms") {
            if (!nextValue(value) || !readIntArg(value, options.intervalMs) || options.intervalMs < 0) {
                return invalid();
            }
            continue;
        }
        if (arg == "--backend") {
            if (!nextValue(value) || !readBackendArg(value, options.backend)) {
                if (errorMessage.empty()) {
                    errorMessage = "Invalid --backend value. Use: auto | cpu | gpu";
                }
                return false;
            }
            continue;
        }

        if (set == OptionSet::Headless) {
            if (arg == "--quiet") {
                options.quiet = true;
                continue;
            }
            if (arg == "--frames") {
                if (!nextValue(value) || !readIntArg(value, options.frames) || options.frames < 1) {
                    return invalid();
                }
                continue;
            }
            if (arg == "--output") {
                if (!nextValue(options.outputPath)) {
                    return false;
                }
                continue;
            }
        }

        errorMessage = "Unknown option: " + arg;
        return false;
    }

    return true;
}

}  // namespace marcher
