#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "broadcast.hpp"
#include "channel.hpp"
#include "frame.hpp"
#include "gpu.hpp"
#include "platform.hpp"
#include "settings.hpp"

// Physical viewing geometry for unit conversion, shared with stimuli.
struct display_geometry {
    std::atomic<double> width_mm{300.0};
    std::atomic<double> viewing_distance_mm{570.0};
};

// Sent by the render task once a frame has been handed to presentation.
struct frame_ack {
    std::uint64_t index = 0;
    timer::time_point presented;
};

// Scoped hold on the device/surface bundle. While one is alive on a thread,
// that thread must not touch the frame or ack channels.
struct gpu_guard {
    gpu_guard(std::mutex&, gpu_state&);
    gpu_guard(gpu_guard&&) noexcept;
    gpu_guard(const gpu_guard&) = delete;
    gpu_guard& operator=(const gpu_guard&) = delete;
    ~gpu_guard();

    gpu_state* operator->() { return state; }
    gpu_state& operator*()  { return *state; }

    void unlock();

    private:
        std::unique_lock<std::mutex> lock;
        gpu_state* state = nullptr;
};

bool gpu_lock_held();

// Shared, cheaply copyable handle on the presentation window. All copies see
// the same device, channels and keyboard broadcast.
struct window_handle {
    window_handle(std::unique_ptr<gpu_device> device,
                  const surface_config& config,
                  std::shared_ptr<platform> tasks,
                  const settings& opts);

    // Experiment side
    void submit(shared_frame);
    frame_ack await_ack();
    frame_ack present(shared_frame f) { submit(std::move(f)); return await_ack(); }
    key_listener keyboard();
    timer::duration sleep(double secs);
    std::size_t in_flight() const;

    // Render side
    shared_frame next_frame();
    void acknowledge(const frame_ack&);

    // Host side
    void resize(int width, int height);
    std::size_t publish_key(const key_event&);
    void close();
    bool closed() const;

    gpu_guard lock_gpu();
    surface_config surface();

    double physical_width_mm() const;
    void set_physical_width_mm(double);
    double viewing_distance_mm() const;
    void set_viewing_distance_mm(double);

    std::shared_ptr<const display_geometry> geometry() const;
    platform& tasks();
    const std::shared_ptr<keyboard_broadcast>& keyboard_source() const;

    private:
        struct shared_state;
        std::shared_ptr<shared_state> state;
};
