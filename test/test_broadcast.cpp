#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "broadcast.hpp"

using namespace std::chrono_literals;

namespace {
key_event press(key k) { return {k, key_state::pressed, timer::now()}; }
}

TEST(keyboard_broadcast, delivers_to_every_active_listener) {
    auto bc = std::make_shared<keyboard_broadcast>(8);
    auto a = bc->listen();
    auto b = bc->listen();
    EXPECT_EQ(bc->publish(press(key::a)), 2u);

    auto ea = a.try_recv();
    auto eb = b.try_recv();
    ASSERT_TRUE(ea);
    ASSERT_TRUE(eb);
    EXPECT_EQ(ea->code, key::a);
    EXPECT_EQ(eb->code, key::a);
    EXPECT_FALSE(a.try_recv());
}

TEST(keyboard_broadcast, overflow_keeps_most_recent) {
    auto bc = std::make_shared<keyboard_broadcast>(3);
    auto l = bc->listen();
    for (auto k: {key::a, key::b, key::c, key::d, key::e}) bc->publish(press(k));

    EXPECT_EQ(l.pending(), 3u);
    EXPECT_EQ(l.dropped(), 2u);
    EXPECT_EQ(l.try_recv()->code, key::c);
    EXPECT_EQ(l.try_recv()->code, key::d);
    EXPECT_EQ(l.try_recv()->code, key::e);
    EXPECT_FALSE(l.try_recv());
}

TEST(keyboard_broadcast, publish_never_blocks_on_slow_listener) {
    auto bc = std::make_shared<keyboard_broadcast>(1);
    auto l = bc->listen();
    for (int i = 0; i < 1000; ++i) bc->publish(press(key::space));
    EXPECT_EQ(l.pending(), 1u);
    EXPECT_EQ(l.dropped(), 999u);
}

TEST(keyboard_broadcast, events_before_activation_are_not_seen) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    EXPECT_EQ(bc->publish(press(key::a)), 0u);
    auto l = bc->listen();
    EXPECT_FALSE(l.try_recv());
}

TEST(keyboard_broadcast, deactivated_listener_is_dropped) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    {
        auto l = bc->listen();
        EXPECT_EQ(bc->active_listeners(), 1u);
    }
    EXPECT_EQ(bc->active_listeners(), 0u);
    EXPECT_EQ(bc->publish(press(key::a)), 0u);

    auto l = bc->listen();
    l.deactivate();
    EXPECT_FALSE(l.active());
    EXPECT_EQ(bc->active_listeners(), 0u);
    EXPECT_FALSE(l.try_recv());
}

TEST(keyboard_broadcast, moved_listener_stays_registered_once) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    auto a = bc->listen();
    key_listener b{std::move(a)};
    EXPECT_EQ(bc->active_listeners(), 1u);
    bc->publish(press(key::x));
    EXPECT_EQ(b.try_recv()->code, key::x);
}

TEST(keyboard_broadcast, recv_waits_for_publish) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    auto l = bc->listen();
    std::thread publisher{[&] { std::this_thread::sleep_for(10ms); bc->publish(press(key::q)); }};
    auto evt = l.recv();
    publisher.join();
    ASSERT_TRUE(evt);
    EXPECT_EQ(evt->code, key::q);
}

TEST(keyboard_broadcast, close_wakes_receivers) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    auto l = bc->listen();
    std::thread closer{[&] { std::this_thread::sleep_for(10ms); bc->close(); }};
    EXPECT_FALSE(l.recv());
    closer.join();
    EXPECT_TRUE(bc->closed());
    EXPECT_EQ(bc->publish(press(key::a)), 0u);
}

TEST(keyboard_broadcast, recv_for_times_out) {
    auto bc = std::make_shared<keyboard_broadcast>(4);
    auto l = bc->listen();
    EXPECT_FALSE(l.recv_for(5ms));
}
