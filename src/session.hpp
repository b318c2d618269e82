#pragma once

#include <functional>

#include "window_handle.hpp"

using experiment_fn = std::function<void(window_handle)>;

// Runs the user's trial logic and closes the window once it returns or
// throws. False if it failed with anything but the shutdown signal.
bool run_experiment(window_handle win, const experiment_fn& experiment);
