#include "experiment.hpp"

#include <atomic>
#include <memory>

#include "config.hpp"
#include "gl_device.hpp"
#include "render_task.hpp"
#include "utils.hpp"
#include "window.hpp"

int start_experiment(const settings& opts, experiment_fn experiment) {
    log_info("psyframe {} ({})", PSYFRAME_VERSION, PSYFRAME_BUILD_TYPE);
    if (!experiment) log_fatal("No experiment to run");
    opts.validate();

    auto tasks = std::make_shared<glfw_platform>();
    host_window window{opts};
    window_handle win{std::make_unique<gl_device>(window.native(), opts.vsync), window.surface(), tasks, opts};

    tasks->spawn("render", [win] { render_task(win); });
    std::atomic<bool> failed{false};
    tasks->spawn("experiment", [win, &failed, experiment=std::move(experiment)] {
        if (!run_experiment(win, experiment)) failed = true;
    });

    window.run(win);

    // Channels are closed by now; both tasks wind down and are joined
    // before the window and its context go away.
    win.close();
    tasks->shutdown();
    if (failed) {
        log_critical("Experiment finished with an error");
        return 1;
    }
    log_info("Experiment finished");
    return 0;
}

int start_experiment(experiment_fn experiment) {
    log_init();
    try {
        return start_experiment(settings::from_env(), std::move(experiment));
    }
    catch (const settings_error& e) {
        log_critical("Invalid configuration: {}", e.what());
        return 1;
    }
}
