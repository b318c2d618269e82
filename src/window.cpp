#include "window.hpp"

#include <vector>

#include "display.hpp"
#include "utils.hpp"

static void glfw_error_callback(int error, const char* description) {
    log_critical("Glfw error {}:\n{}", error, description);
}

static host_window& owner(GLFWwindow* window) {
    return *static_cast<host_window*>(glfwGetWindowUserPointer(window));
}

void key_callback(GLFWwindow* window, int code, int scancode, int action, int mods) {
    auto now = timer::now();
    auto state = action == GLFW_RELEASE ? key_state::released : key_state::pressed;
    owner(window).events.push_back(evt_key{key_from_glfw(code), state, now});
}

void framebuffer_callback(GLFWwindow* window, int width, int height) {
    owner(window).events.push_back(evt_resize{width, height});
}

void close_callback(GLFWwindow* window) {
    owner(window).events.push_back(evt_close{});
}

GLFWmonitor* host_window::pick_monitor(const settings& opts) {
    int count = 0;
    auto monitors = glfwGetMonitors(&count);
    if (count == 0 || monitors == nullptr) log_fatal("No monitor connected");
    auto idx = resolve_monitor(opts.monitor, count);
    if (!idx) {
        log_warn("The specified monitor with index {} does not exist. Using the primary monitor instead.", opts.monitor);
        return glfwGetPrimaryMonitor();
    }
    return monitors[*idx];
}

host_window::host_window(const settings& opts) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) log_fatal("Failed to initialise GLFW");
    log_info("Setting up window with OpenGL 4.1 Core forward compatible");
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, 1);
    glfwWindowHint(GLFW_DOUBLEBUFFER, 1);

    auto monitor = pick_monitor(opts);
    log_info("Monitor: {}", glfwGetMonitorName(monitor));

    int count = 0;
    auto glfw_modes = glfwGetVideoModes(monitor, &count);
    std::vector<video_mode> modes;
    for (int ix = 0; ix < count; ++ix) {
        modes.push_back({glfw_modes[ix].width, glfw_modes[ix].height, glfw_modes[ix].refreshRate});
    }
    auto mode = select_video_mode(modes);
    if (!mode) log_fatal("Monitor reports no video modes");
    log_info("Selected video mode: {}", *mode);

    if (opts.fullscreen) {
        glfwWindowHint(GLFW_REFRESH_RATE, mode->refresh_hz);
        handle = glfwCreateWindow(mode->width, mode->height, "psyframe", monitor, nullptr);
    }
    else {
        handle = glfwCreateWindow(opts.window_width, opts.window_height, "psyframe", nullptr, nullptr);
    }
    if (handle == nullptr) log_fatal("Failed to obtain window");
    log_info("OpenGL version instantiated {}.{}",
             glfwGetWindowAttrib(handle, GLFW_CONTEXT_VERSION_MAJOR),
             glfwGetWindowAttrib(handle, GLFW_CONTEXT_VERSION_MINOR));

    glfwSetWindowUserPointer(handle, this);
    glfwSetKeyCallback(handle, key_callback);
    glfwSetFramebufferSizeCallback(handle, framebuffer_callback);
    glfwSetWindowCloseCallback(handle, close_callback);
}

host_window::~host_window() {
    glfwDestroyWindow(handle);
    glfwTerminate();
}

surface_config host_window::surface() const {
    surface_config config;
    glfwGetFramebufferSize(handle, &config.width, &config.height);
    return config;
}

void host_window::run(window_handle& win) {
    log_debug("Host loop running on thread {}", thread_name());
    while (!win.closed()) {
        // Woken by input, window events or glfwPostEmptyEvent from close()
        glfwWaitEvents();
        dispatch(win, events);
    }
    log_debug("Host loop stopped");
}
