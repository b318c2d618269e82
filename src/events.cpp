#include "events.hpp"

#include "window_handle.hpp"

namespace {
struct event_visitor {
    window_handle* win;

    event_visitor(window_handle* win_): win{win_} {}

    void operator()(const evt_key& e) {
        if (e.code == key::escape) {
            log_info("Escape pressed, terminating");
            win->close();
            return;
        }
        win->publish_key({e.code, e.state, e.timestamp});
    }
    void operator()(const evt_resize& e) { win->resize(e.width, e.height); }
    void operator()(const evt_close&) {
        log_info("Window close requested");
        win->close();
    }
};
}

void dispatch(window_handle& win, const host_event& evt) {
    std::visit(event_visitor{&win}, evt);
}

void dispatch(window_handle& win, host_event_queue& events) {
    for (const auto& evt: events) {
        if (win.closed()) break;
        dispatch(win, evt);
    }
    events.clear();
}
