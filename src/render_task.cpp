#include "render_task.hpp"

#include <exception>

#include "utils.hpp"

bool render_next_frame(window_handle& win) {
    shared_frame next;
    try {
        next = win.next_frame();
    }
    catch (const channel_closed&) {
        return false;
    }

    auto t0 = timer::now();
    {
        auto gpu = win.lock_gpu();
        auto& device = *gpu->device;
        const auto config = gpu->config;

        texture_view target;
        try {
            target = device.acquire();
        }
        catch (const gpu_error& e) {
            log_fatal("Could not acquire render target for frame {}: {}", next->index(), e.what());
        }

        command_encoder encoder;
        next->for_each([&](renderable& item) { item.prepare(device, target, config); });
        next->for_each([&](renderable& item) { item.render(encoder, target); });

        try {
            device.submit(encoder.finish());
            device.present();
        }
        catch (const gpu_error& e) {
            log_fatal("GPU submission failed for frame {}: {}", next->index(), e.what());
        }
    }
    // Lock is gone before the ack channel is touched
    frame_ack ack{next->index(), timer::now()};
    log_trace("Frame {} presented after {} us", ack.index, to_us(ack.presented - t0));
    try {
        win.acknowledge(ack);
    }
    catch (const channel_closed&) {
        return false;
    }
    return true;
}

void render_task(window_handle win) {
    log_debug("Render task running on thread {}", thread_name());
    win.lock_gpu()->device->attach();
    std::uint64_t frames = 0;
    try {
        while (render_next_frame(win)) frames++;
    }
    catch (const std::exception& e) {
        // Nobody else consumes frames; closing lets the experiment and host loop exit
        log_critical("Render task failed after {} frames: {}", frames, e.what());
        win.close();
    }
    win.lock_gpu()->device->detach();
    log_debug("Render task stopped after {} frames", frames);
}
