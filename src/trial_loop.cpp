#include "trial_loop.hpp"

#include <algorithm>

trial_loop::trial_loop(key_listener listener_, loop_options opts_, std::function<void()> body_, std::function<bool()> stop_):
    listener{std::move(listener_)}, opts{std::move(opts_)}, body{std::move(body_)}, stop{std::move(stop_)}
{
    if (!body) log_error("Trial loop needs a body");
}

bool trial_loop::wanted(const key_event& evt) const {
    return matches(opts.state, evt.state)
        && std::find(opts.keys.begin(), opts.keys.end(), evt.code) != opts.keys.end();
}

trial_loop::phase trial_loop::step() {
    switch (state) {
        case phase::init:
            start = timer::now();
            state = phase::run_body;
            break;
        case phase::check_timeout: {
            if (stop && stop()) throw channel_closed{"trial loop: window closed"};
            auto elapsed = timer::now() - start;
            if (opts.timeout && elapsed >= *opts.timeout) {
                outcome = {std::nullopt, elapsed};
                state = phase::terminal;
            }
            else {
                state = phase::drain_events;
            }
            break;
        }
        case phase::drain_events:
            state = phase::run_body;
            while (auto evt = listener.try_recv()) {
                if (wanted(*evt)) {
                    outcome = {evt->code, timer::now() - start};
                    log_debug("Trial loop matched key {} ({}) after {} ms", evt->code, evt->state, to_ms(outcome.elapsed));
                    state = phase::terminal;
                    break;
                }
            }
            break;
        case phase::run_body:
            body();
            state = phase::check_timeout;
            break;
        case phase::terminal:
            break;
    }
    return state;
}

loop_result trial_loop::run() {
    while (step() != phase::terminal) {}
    listener.deactivate();
    return outcome;
}

loop_result loop_frames(window_handle& win, const loop_options& opts, std::function<void()> body) {
    trial_loop loop{win.keyboard(), opts, std::move(body), [win] { return win.closed(); }};
    return loop.run();
}

loop_result loop_frames_with(window_handle& win, const loop_options& opts, std::function<void(frame&)> body) {
    if (!body) log_error("Trial loop needs a body");
    return loop_frames(win, opts, [&win, body=std::move(body)] {
        auto next = make_frame();
        body(*next);
        win.present(next);
    });
}
