#pragma once

#include <string>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "events.hpp"
#include "gpu.hpp"
#include "platform.hpp"
#include "settings.hpp"
#include "window_handle.hpp"

// Wakes the host loop out of glfwWaitEvents when a task asks for it.
struct glfw_platform: thread_platform {
    void request_frame() override { glfwPostEmptyEvent(); }
};

// Owns the OS window and the input pump. Lives on the main thread; the GL
// context is left unbound here so the render task can take it.
struct host_window {
    explicit host_window(const settings&);
    ~host_window();

    host_window(const host_window&) = delete;
    host_window& operator=(const host_window&) = delete;

    // Pumps events into `win` until it is closed.
    void run(window_handle& win);

    surface_config surface() const;
    GLFWwindow* native() const { return handle; }

    private:
        friend void key_callback(GLFWwindow*, int, int, int, int);
        friend void framebuffer_callback(GLFWwindow*, int, int);
        friend void close_callback(GLFWwindow*);

        GLFWmonitor* pick_monitor(const settings&);

        GLFWwindow* handle = nullptr;
        host_event_queue events;
};
