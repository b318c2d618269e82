#pragma once

#include <variant>
#include <vector>

#include "input.hpp"

struct window_handle;

struct evt_key { key code; key_state state; timer::time_point timestamp; };
struct evt_resize { int width; int height; };
struct evt_close {};

using host_event = std::variant<evt_key, evt_resize, evt_close>;

using host_event_queue = std::vector<host_event>;

// Applies one host event to the window: escape and close requests terminate,
// resizes reconfigure the surface, every other key goes to the broadcast.
void dispatch(window_handle&, const host_event&);
void dispatch(window_handle&, host_event_queue&);
