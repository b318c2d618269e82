#include "experiment.hpp"
#include "stimulus.hpp"
#include "trial_loop.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <vector>

// Full screen red/green flicker on every refresh. The ack timestamps show
// whether each frame made its vsync deadline. Space ends the run.
void flicker_experiment(window_handle win) {
    std::array colours{colors::red, colors::green};
    std::size_t state = 0;
    auto flicker = std::make_shared<patch_stimulus>(win, rectangle::fullscreen(), colours[state]);

    std::vector<timer::time_point> onsets;
    auto [found, elapsed] = loop_frames(win, {.keys = {key::space}, .state = key_state::pressed}, [&] {
        state = (state + 1) % colours.size();
        flicker->set_color(colours[state]);
        auto next = make_frame();
        next->add(flicker);
        onsets.push_back(win.present(next).presented);
    });

    log_info("Stopped by {} after {} s and {} frames", found ? to_string(*found) : "timeout", to_secs(elapsed), onsets.size());
    if (onsets.size() > 1) {
        std::vector<double> intervals;
        for (std::size_t ix = 1; ix < onsets.size(); ++ix) intervals.push_back(to_ms(onsets[ix] - onsets[ix - 1]));
        auto mean = (to_ms(onsets.back() - onsets.front()))/intervals.size();
        auto [lo, hi] = std::minmax_element(intervals.begin(), intervals.end());
        log_info("Frame interval: mean {:.3f} ms, min {:.3f} ms, max {:.3f} ms", mean, *lo, *hi);
    }
    win.close();
}

int main(int, char**) {
    return start_experiment(flicker_experiment);
}
