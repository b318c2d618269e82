#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

enum class texture_format { rgba8, rgba16f };
enum class present_mode { fifo, immediate };

struct surface_config {
    int width  = 1;
    int height = 1;
    texture_format format = texture_format::rgba16f;
    present_mode   mode   = present_mode::fifo;

    friend bool operator==(const surface_config&, const surface_config&) = default;
};

// Render target for one frame
struct texture_view {
    unsigned framebuffer = 0;
    int width  = 0;
    int height = 0;
};

struct gpu_error: std::runtime_error {
    explicit gpu_error(const std::string& what): std::runtime_error{what} {}
};

using gpu_command = std::function<void()>;

struct command_buffer {
    std::vector<gpu_command> commands;
};

// Collects the draw commands of every stimulus in a frame into one buffer.
struct command_encoder {
    void record(gpu_command);
    command_buffer finish();

    std::size_t size() const { return commands.size(); }
    bool finished() const { return done; }

    private:
        std::vector<gpu_command> commands;
        bool done = false;
};

struct gpu_device {
    virtual ~gpu_device() = default;

    // Bind to and release from the calling (render) thread
    virtual void attach() {}
    virtual void detach() {}

    virtual void configure(const surface_config&) = 0;
    virtual texture_view acquire() = 0;
    virtual void submit(command_buffer) = 0;
    virtual void present() = 0;
};

// The device/surface bundle guarded by the window's GPU lock.
struct gpu_state {
    std::unique_ptr<gpu_device> device;
    surface_config config;
};
