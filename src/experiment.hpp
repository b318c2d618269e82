#pragma once

#include "session.hpp"
#include "settings.hpp"

// Opens the presentation window, starts the render task and `experiment` on
// their own threads and pumps host events on the calling (main) thread until
// the window closes. Returns the process exit code, non-zero if the
// experiment failed.
int start_experiment(const settings&, experiment_fn experiment);

// As above with settings taken from the environment.
int start_experiment(experiment_fn experiment);
