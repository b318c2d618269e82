#include "window_handle.hpp"

#include <algorithm>

namespace {
thread_local int gpu_lock_depth = 0;

void ensure_unlocked(const char* what) {
    if (gpu_lock_held()) log_logic_error("{} called while holding the GPU lock", what);
}
}

bool gpu_lock_held() { return gpu_lock_depth > 0; }

gpu_guard::gpu_guard(std::mutex& mtx, gpu_state& gpu): lock{mtx}, state{&gpu} { gpu_lock_depth++; }

gpu_guard::gpu_guard(gpu_guard&& other) noexcept: lock{std::move(other.lock)}, state{other.state} { other.state = nullptr; }

gpu_guard::~gpu_guard() { unlock(); }

void gpu_guard::unlock() {
    if (!lock.owns_lock()) return;
    lock.unlock();
    state = nullptr;
    gpu_lock_depth--;
}

struct window_handle::shared_state {
    std::mutex gpu_mutex;
    gpu_state gpu;

    channel<shared_frame> frames{1, "frame channel"};
    channel<frame_ack>    acks{1, "ack channel"};
    std::shared_ptr<keyboard_broadcast> keyboard;

    std::shared_ptr<display_geometry> geometry = std::make_shared<display_geometry>();
    std::atomic<bool> terminate{false};

    // Serialises submit/await_ack between copies of the handle
    std::mutex submit_mutex;
    std::atomic<std::size_t> in_flight{0};
    std::uint64_t next_index = 1;
    frame_ack last_ack;

    std::shared_ptr<platform> tasks;
};

window_handle::window_handle(std::unique_ptr<gpu_device> device,
                             const surface_config& config,
                             std::shared_ptr<platform> tasks,
                             const settings& opts):
    state{std::make_shared<shared_state>()}
{
    if (!device) log_fatal("No graphics device to present on");
    if (!tasks)  log_fatal("No task platform to run on");
    opts.validate();
    state->gpu.device = std::move(device);
    state->gpu.config = config;
    state->gpu.config.width  = std::max(1, config.width);
    state->gpu.config.height = std::max(1, config.height);
    state->gpu.device->configure(state->gpu.config);
    state->keyboard = std::make_shared<keyboard_broadcast>(opts.key_buffer);
    state->geometry->width_mm            = opts.physical_width_mm;
    state->geometry->viewing_distance_mm = opts.viewing_distance_mm;
    state->tasks = std::move(tasks);
    log_debug("Window handle ready: {}x{}, display {} mm wide at {} mm",
              state->gpu.config.width, state->gpu.config.height,
              opts.physical_width_mm, opts.viewing_distance_mm);
}

void window_handle::submit(shared_frame f) {
    ensure_unlocked("submit");
    if (!f) log_error("Cannot submit an empty frame pointer");
    std::lock_guard<std::mutex> lock{state->submit_mutex};
    if (state->in_flight > 0) {
        // Previous frame is still on its way; its ack comes first
        state->last_ack = state->acks.recv();
        state->in_flight--;
    }
    auto index = state->next_index++;
    f->set_index(index);
    state->frames.send(std::move(f));
    state->in_flight++;
    log_trace("Submitted frame {}", index);
}

frame_ack window_handle::await_ack() {
    ensure_unlocked("await_ack");
    std::lock_guard<std::mutex> lock{state->submit_mutex};
    if (state->in_flight == 0) return state->last_ack;
    state->last_ack = state->acks.recv();
    state->in_flight--;
    return state->last_ack;
}

std::size_t window_handle::in_flight() const { return state->in_flight; }

key_listener window_handle::keyboard() { return state->keyboard->listen(); }

timer::duration window_handle::sleep(double secs) { return state->tasks->sleep(from_secs(secs)); }

shared_frame window_handle::next_frame() {
    ensure_unlocked("next_frame");
    return state->frames.recv();
}

void window_handle::acknowledge(const frame_ack& ack) {
    ensure_unlocked("acknowledge");
    state->acks.send(ack);
}

void window_handle::resize(int width, int height) {
    auto gpu = lock_gpu();
    gpu->config.width  = std::max(1, width);
    gpu->config.height = std::max(1, height);
    gpu->device->configure(gpu->config);
    log_info("Surface reconfigured to {}x{}", gpu->config.width, gpu->config.height);
}

std::size_t window_handle::publish_key(const key_event& evt) { return state->keyboard->publish(evt); }

void window_handle::close() {
    if (state->terminate.exchange(true)) return;
    log_info("Closing window");
    state->frames.close();
    state->acks.close();
    state->keyboard->close();
    state->tasks->request_frame();
}

bool window_handle::closed() const { return state->terminate; }

gpu_guard window_handle::lock_gpu() { return gpu_guard{state->gpu_mutex, state->gpu}; }

surface_config window_handle::surface() { return lock_gpu()->config; }

double window_handle::physical_width_mm() const { return state->geometry->width_mm; }
void window_handle::set_physical_width_mm(double mm) {
    if (!(mm > 0.0)) log_error("Physical display width must be positive, got {} mm", mm);
    state->geometry->width_mm = mm;
}

double window_handle::viewing_distance_mm() const { return state->geometry->viewing_distance_mm; }
void window_handle::set_viewing_distance_mm(double mm) {
    if (!(mm > 0.0)) log_error("Viewing distance must be positive, got {} mm", mm);
    state->geometry->viewing_distance_mm = mm;
}

std::shared_ptr<const display_geometry> window_handle::geometry() const { return state->geometry; }

platform& window_handle::tasks() { return *state->tasks; }

const std::shared_ptr<keyboard_broadcast>& window_handle::keyboard_source() const { return state->keyboard; }
