#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "fakes.hpp"
#include "render_task.hpp"
#include "trial_loop.hpp"

using namespace std::chrono_literals;

namespace {
key_event event(key k, key_state s = key_state::pressed) { return {k, s, timer::now()}; }
}

TEST(trial_loop, steps_through_phases) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    int ticks = 0;
    trial_loop loop{bc->listen(), {}, [&] { ticks++; }};
    using phase = trial_loop::phase;

    EXPECT_EQ(loop.current(), phase::init);
    EXPECT_EQ(loop.step(), phase::run_body);
    EXPECT_EQ(ticks, 0);
    EXPECT_EQ(loop.step(), phase::check_timeout);
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(loop.step(), phase::drain_events);
    EXPECT_EQ(loop.step(), phase::run_body);
    EXPECT_EQ(loop.step(), phase::check_timeout);
    EXPECT_EQ(ticks, 2);
}

TEST(trial_loop, zero_timeout_runs_body_once) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    int ticks = 0;
    trial_loop loop{bc->listen(), {.timeout = timer::duration::zero()}, [&] { ticks++; }};
    auto result = loop.run();
    EXPECT_EQ(ticks, 1);
    EXPECT_FALSE(result.found);
    EXPECT_EQ(loop.current(), trial_loop::phase::terminal);
}

TEST(trial_loop, timeout_is_not_early) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    int ticks = 0;
    trial_loop loop{bc->listen(), {.keys = {key::space}, .timeout = 30ms}, [&] { ticks++; std::this_thread::sleep_for(1ms); }};
    auto result = loop.run();
    EXPECT_FALSE(result.found);
    EXPECT_GE(result.elapsed, 30ms);
    EXPECT_GE(ticks, 1);
}

TEST(trial_loop, timeout_overshoot_is_bounded_by_one_body) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    constexpr auto body = 10ms, timeout = 30ms;
    trial_loop loop{bc->listen(), {.keys = {key::space}, .timeout = timeout}, [&] { std::this_thread::sleep_for(body); }};
    auto result = loop.run();
    EXPECT_FALSE(result.found);
    EXPECT_GE(result.elapsed, timeout);
    EXPECT_LT(result.elapsed, timeout + 2*body);
}

TEST(trial_loop, match_latency_is_bounded_by_one_body) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    constexpr auto body = 10ms, press_at = 25ms;
    auto t0 = timer::now();
    timer::time_point first_tick{}, published{};
    trial_loop loop{bc->listen(), {.keys = {key::a}, .timeout = 1s}, [&] {
        if (first_tick == timer::time_point{}) first_tick = timer::now();
        std::this_thread::sleep_for(body);
    }};
    std::thread host{[&] {
        std::this_thread::sleep_until(t0 + press_at);
        published = timer::now();
        bc->publish(event(key::a));
    }};
    auto result = loop.run();
    host.join();

    ASSERT_TRUE(result.found);
    EXPECT_EQ(*result.found, key::a);
    // The loop started between t0 and the first tick
    EXPECT_GE(result.elapsed, published - first_tick);
    EXPECT_LT(result.elapsed, (published - t0) + 2*body);
}

TEST(trial_loop, matching_key_ends_after_next_check) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    int ticks = 0;
    trial_loop loop{bc->listen(), {.keys = {key::a, key::b}, .state = key_state::pressed}, [&] {
        if (++ticks == 3) bc->publish(event(key::b));
    }};
    auto result = loop.run();
    ASSERT_TRUE(result.found);
    EXPECT_EQ(*result.found, key::b);
    EXPECT_EQ(ticks, 3);
}

TEST(trial_loop, state_mismatch_is_ignored) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    trial_loop loop{bc->listen(), {.keys = {key::a}, .state = key_state::pressed, .timeout = 10ms}, [&] {
        bc->publish(event(key::a, key_state::released));
    }};
    auto result = loop.run();
    EXPECT_FALSE(result.found);
}

TEST(trial_loop, any_state_matches_release) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    trial_loop loop{bc->listen(), {.keys = {key::a}, .timeout = 1s}, [&] {
        bc->publish(event(key::a, key_state::released));
    }};
    auto result = loop.run();
    ASSERT_TRUE(result.found);
    EXPECT_EQ(*result.found, key::a);
    EXPECT_LT(result.elapsed, 1s);
}

TEST(trial_loop, other_keys_are_ignored) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    trial_loop loop{bc->listen(), {.keys = {key::a}, .timeout = 10ms}, [&] { bc->publish(event(key::z)); }};
    EXPECT_FALSE(loop.run().found);
}

TEST(trial_loop, empty_key_set_only_times_out) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    trial_loop loop{bc->listen(), {.timeout = 10ms}, [&] { bc->publish(event(key::space)); }};
    auto result = loop.run();
    EXPECT_FALSE(result.found);
    EXPECT_GE(result.elapsed, 10ms);
}

TEST(trial_loop, earlier_events_are_not_seen) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    bc->publish(event(key::a));
    trial_loop loop{bc->listen(), {.keys = {key::a}, .timeout = 10ms}, [] {}};
    EXPECT_FALSE(loop.run().found);
}

TEST(trial_loop, listener_released_after_run) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    trial_loop loop{bc->listen(), {.timeout = timer::duration::zero()}, [] {}};
    EXPECT_EQ(bc->active_listeners(), 1u);
    loop.run();
    EXPECT_EQ(bc->active_listeners(), 0u);
}

TEST(trial_loop, body_is_required) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    EXPECT_THROW((trial_loop{bc->listen(), {}, nullptr}), std::runtime_error);
}

TEST(loop_frames, closed_window_raises) {
    fake_window fw;
    auto& win = *fw.win;
    int ticks = 0;
    EXPECT_THROW(loop_frames(win, {}, [&] { if (++ticks == 2) win.close(); }), channel_closed);
    EXPECT_EQ(ticks, 2);
}

TEST(loop_frames, sees_keys_from_host) {
    fake_window fw;
    auto& win = *fw.win;
    auto result = loop_frames(win, {.keys = {key::enter}, .timeout = 1s}, [&] {
        win.publish_key(event(key::enter));
    });
    ASSERT_TRUE(result.found);
    EXPECT_EQ(*result.found, key::enter);
}

TEST(loop_frames, presents_one_frame_per_tick) {
    fake_window fw;
    auto& win = *fw.win;
    fw.tasks->spawn("render", [w=win] { render_task(w); });

    int ticks = 0;
    auto stim = std::make_shared<recording_stimulus>("dot", fw.log);
    loop_frames_with(win, {.timeout = 20ms}, [&](frame& f) {
        f.add(stim);
        ticks++;
    });
    EXPECT_GE(ticks, 1);
    EXPECT_EQ(fw.device->presents, ticks);
    EXPECT_EQ(fw.log->count("draw dot"), static_cast<std::size_t>(ticks));
    EXPECT_EQ(win.in_flight(), 0u);
}
