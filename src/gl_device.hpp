#pragma once

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "gpu.hpp"

// OpenGL presentation on a GLFW window. Every call except `configure` must
// come from the thread that called `attach`.
struct gl_device: gpu_device {
    gl_device(GLFWwindow* window, bool vsync);

    void attach() override;
    void detach() override;

    void configure(const surface_config&) override;
    texture_view acquire() override;
    void submit(command_buffer) override;
    void present() override;

    private:
        GLFWwindow* window = nullptr;
        bool vsync    = true;
        bool attached = false;
        bool dirty    = true;
        surface_config config;
};

void gl_check_error(const char* where);
