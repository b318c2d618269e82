#include "gl_device.hpp"

#include <glbinding/gl/gl.h>
#include <glbinding/glbinding.h>

#include <fmt/format.h>

#include "utils.hpp"

using namespace gl;

void gl_check_error(const char* where) {
    auto rc = glGetError();
    if (rc != GL_NO_ERROR) throw gpu_error{fmt::format("OpenGL error @ {}: 0x{:x}", where, static_cast<unsigned>(rc))};
}

gl_device::gl_device(GLFWwindow* w, bool sync): window{w}, vsync{sync} {
    if (window == nullptr) log_fatal("OpenGL device needs a window");
}

void gl_device::attach() {
    glfwMakeContextCurrent(window);
    glbinding::initialize(glfwGetProcAddress);
    glfwSwapInterval(vsync ? 1 : 0);
    attached = true;
    dirty = true;
    log_info("OpenGL {} on {}, vsync {}",
             reinterpret_cast<const char*>(glGetString(GL_VERSION)),
             reinterpret_cast<const char*>(glGetString(GL_RENDERER)),
             vsync ? "on" : "off");
}

void gl_device::detach() {
    if (!attached) return;
    glfwMakeContextCurrent(nullptr);
    attached = false;
}

void gl_device::configure(const surface_config& cfg) {
    config = cfg;
    dirty = true;
}

texture_view gl_device::acquire() {
    if (!attached) throw gpu_error{"acquire on a device without a current context"};
    if (dirty) {
        glViewport(0, 0, config.width, config.height);
        dirty = false;
        log_debug("Viewport set to {}x{}", config.width, config.height);
    }
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glDisable(GL_SCISSOR_TEST);
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    gl_check_error("acquire");
    return {0, config.width, config.height};
}

void gl_device::submit(command_buffer buffer) {
    if (!attached) throw gpu_error{"submit on a device without a current context"};
    for (auto& cmd: buffer.commands) cmd();
    glFlush();
    gl_check_error("submit");
}

void gl_device::present() {
    glfwSwapBuffers(window);
    // Block until the swap has happened so the ack marks the actual flip
    glFinish();
    gl_check_error("present");
}
