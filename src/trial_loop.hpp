#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "input.hpp"
#include "window_handle.hpp"

struct loop_options {
    std::vector<key> keys;
    key_state state = key_state::any;
    std::optional<timer::duration> timeout;
};

struct loop_result {
    std::optional<key> found;  // empty on timeout
    timer::duration elapsed{};
};

// Per-tick polling loop: run the body, stop on a matching key or once the
// timeout has passed. The body runs once before the first check, so a frame
// goes out on every iteration and input is seen within one body duration.
struct trial_loop {
    enum class phase { init, check_timeout, drain_events, run_body, terminal };

    // `stop` is polled with the timeout; once it returns true the loop raises `channel_closed`.
    trial_loop(key_listener listener, loop_options opts, std::function<void()> body, std::function<bool()> stop={});

    // Advances by one state; returns the state it moved to.
    phase step();
    loop_result run();

    phase current() const { return state; }
    const loop_result& result() const { return outcome; }

    private:
        bool wanted(const key_event&) const;

        key_listener listener;
        loop_options opts;
        std::function<void()> body;
        std::function<bool()> stop;
        phase state = phase::init;
        timer::time_point start;
        loop_result outcome;
};

loop_result loop_frames(window_handle& win, const loop_options& opts, std::function<void()> body);

// Hands the body a fresh frame every tick and presents it once the body returns.
loop_result loop_frames_with(window_handle& win, const loop_options& opts, std::function<void(frame&)> body);
