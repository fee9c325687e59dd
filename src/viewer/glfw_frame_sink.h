#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <GLFW/glfw3.h>

#include "app/frame_loop.h"

namespace marcher {

// Window sink: blits each frame as a texture onto a full-window quad.
class GlfwFrameSink final : public FrameSink {
public:
    GlfwFrameSink(int width, int height, const std::string& title)
        : width_(width), height_(height) {
        if (!glfwInit()) {
            throw std::runtime_error("GLFW initialization failed");
        }

        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
        glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

        window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
        if (window_ == nullptr) {
            glfwTerminate();
            throw std::runtime_error("Failed to create GLFW window");
        }

        glfwMakeContextCurrent(window_);
        glfwSwapInterval(0);

        glGenTextures(1, &texture_);
        glBindTexture(GL_TEXTURE_2D, texture_);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(
            GL_TEXTURE_2D,
            0,
            GL_RGBA,
            width_,
            height_,
            0,
            GL_RGBA,
            GL_UNSIGNED_BYTE,
            nullptr);
    }

    GlfwFrameSink(const GlfwFrameSink&) = delete;
    GlfwFrameSink& operator=(const GlfwFrameSink&) = delete;

    ~GlfwFrameSink() override {
        if (texture_ != 0) {
            glDeleteTextures(1, &texture_);
        }
        glfwDestroyWindow(window_);
        glfwTerminate();
    }

    void poll() override {
        glfwPollEvents();
        if (glfwGetKey(window_, GLFW_KEY_ESCAPE) == GLFW_PRESS) {
            escapePressed_ = true;
        }
    }

    void present(const Framebuffer& frame) override {
        if (frame.width() != width_ || frame.height() != height_) {
            throw std::invalid_argument("Frame size does not match the window");
        }

        frame.copyToRgba8(uploadBytes_);
        glBindTexture(GL_TEXTURE_2D, texture_);
        glTexSubImage2D(
            GL_TEXTURE_2D,
            0,
            0,
            0,
            width_,
            height_,
            GL_RGBA,
            GL_UNSIGNED_BYTE,
            uploadBytes_.data());

        drawFullscreenQuad();
        glfwSwapBuffers(window_);
    }

    [[nodiscard]] bool isOpen() const override {
        return glfwWindowShouldClose(window_) == GLFW_FALSE;
    }

    [[nodiscard]] bool exitRequested() const override {
        return escapePressed_;
    }

    void setTitle(const std::string& title) {
        glfwSetWindowTitle(window_, title.c_str());
    }

private:
    int width_;
    int height_;
    GLFWwindow* window_ = nullptr;
    GLuint texture_ = 0;
    bool escapePressed_ = false;
    std::vector<std::uint8_t> uploadBytes_;

    void drawFullscreenQuad() const {
        int framebufferWidth = 0;
        int framebufferHeight = 0;
        glfwGetFramebufferSize(window_, &framebufferWidth, &framebufferHeight);

        glViewport(0, 0, framebufferWidth, framebufferHeight);
        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        glOrtho(-1.0, 1.0, -1.0, 1.0, -1.0, 1.0);

        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();

        glEnable(GL_TEXTURE_2D);
        glBindTexture(GL_TEXTURE_2D, texture_);

        // Row 0 of the framebuffer is the top of the image.
        glBegin(GL_QUADS);
        glTexCoord2f(0.0f, 1.0f);
        glVertex2f(-1.0f, -1.0f);

        glTexCoord2f(1.0f, 1.0f);
        glVertex2f(1.0f, -1.0f);

        glTexCoord2f(1.0f, 0.0f);
        glVertex2f(1.0f, 1.0f);

        glTexCoord2f(0.0f, 0.0f);
        glVertex2f(-1.0f, 1.0f);
        glEnd();

        glDisable(GL_TEXTURE_2D);
    }
};

}  // namespace marcher
