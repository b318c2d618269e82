#pragma once

#include "window_handle.hpp"

// Consumes frames from the handle until the frame channel closes. Per frame:
// prepare every item, render every item into one encoder, submit it once,
// present, drop the GPU lock, then acknowledge. A failed submission aborts;
// any other failure closes the window.
void render_task(window_handle win);

// One cycle of the above; false once the frame channel is closed.
bool render_next_frame(window_handle& win);
