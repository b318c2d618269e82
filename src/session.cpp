#include "session.hpp"

#include <exception>

bool run_experiment(window_handle win, const experiment_fn& experiment) {
    auto ok = true;
    try {
        experiment(win);
    }
    catch (const channel_closed& e) {
        log_debug("Experiment interrupted: {}", e.what());
    }
    catch (const std::exception& e) {
        log_critical("Experiment failed: {}", e.what());
        ok = false;
    }
    win.close();
    return ok;
}
