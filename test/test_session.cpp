#include <gtest/gtest.h>

#include <stdexcept>

#include "fakes.hpp"
#include "session.hpp"

TEST(session, clean_run_closes_window) {
    fake_window fw;
    int calls = 0;
    EXPECT_TRUE(run_experiment(*fw.win, [&](window_handle) { calls++; }));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(fw.win->closed());
}

TEST(session, shutdown_signal_is_not_a_failure) {
    fake_window fw;
    EXPECT_TRUE(run_experiment(*fw.win, [](window_handle) { throw channel_closed{"ack channel"}; }));
    EXPECT_TRUE(fw.win->closed());
}

TEST(session, failing_experiment_is_reported) {
    fake_window fw;
    EXPECT_FALSE(run_experiment(*fw.win, [](window_handle) { throw std::runtime_error{"bad trial list"}; }));
    EXPECT_TRUE(fw.win->closed());
}
