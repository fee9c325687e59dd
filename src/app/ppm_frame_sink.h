#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include "app/frame_loop.h"

namespace marcher {

// Headless sink: accepts a fixed number of frames, then writes the last one to disk and closes.
class PpmFrameSink final : public FrameSink {
public:
    PpmFrameSink(std::string outputPath, int frameLimit, bool quiet)
        : outputPath_(std::move(outputPath)), frameLimit_(frameLimit), quiet_(quiet) {}

    void poll() override {}

    void present(const Framebuffer& frame) override {
        ++framesPresented_;
        if (!quiet_) {
            std::cout << "Frame " << framesPresented_ << "/" << frameLimit_ << " done\n";
        }
        if (framesPresented_ < frameLimit_) {
            return;
        }

        const std::filesystem::path outPath(outputPath_);
        if (outPath.has_parent_path()) {
            std::filesystem::create_directories(outPath.parent_path());
        }
        frame.writePPM(outputPath_);
        open_ = false;
    }

    [[nodiscard]] bool isOpen() const override { return open_ && frameLimit_ > 0; }
    [[nodiscard]] bool exitRequested() const override { return false; }

    [[nodiscard]] int framesPresented() const { return framesPresented_; }

private:
    std::string outputPath_;
    int frameLimit_;
    bool quiet_;
    int framesPresented_ = 0;
    bool open_ = true;
};

}  // namespace marcher
