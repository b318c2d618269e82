#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "input.hpp"

struct key_listener;

// Fan-out of host key events. Every listener owns a bounded buffer; a full
// buffer evicts its oldest event so it always holds the most recent ones.
// Only listeners that are active at publish time receive an event.
struct keyboard_broadcast: std::enable_shared_from_this<keyboard_broadcast> {
    struct listener_queue {
        std::deque<key_event> events;
        std::size_t dropped = 0;
    };

    explicit keyboard_broadcast(std::size_t capacity);

    keyboard_broadcast(const keyboard_broadcast&) = delete;
    keyboard_broadcast& operator=(const keyboard_broadcast&) = delete;

    // Never blocks, returns the number of listeners reached.
    std::size_t publish(const key_event&);

    key_listener listen();

    void close();
    bool closed() const;

    std::size_t capacity() const { return capacity_; }
    std::size_t active_listeners() const;

    private:
        friend struct key_listener;

        void deactivate(const std::shared_ptr<listener_queue>&);

        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable published_;
        std::vector<std::shared_ptr<listener_queue>> listeners_;
        bool closed_ = false;
};

// One activated view on the broadcast, deactivated on destruction.
struct key_listener {
    key_listener() = default;
    key_listener(key_listener&&) noexcept = default;
    key_listener& operator=(key_listener&&) noexcept;
    key_listener(const key_listener&) = delete;
    key_listener& operator=(const key_listener&) = delete;
    ~key_listener();

    std::optional<key_event> try_recv();
    // Blocks; empty once the broadcast is closed and the buffer is drained.
    std::optional<key_event> recv();
    std::optional<key_event> recv_for(timer::duration timeout);

    std::size_t pending() const;
    std::size_t dropped() const;
    bool active() const { return source_ != nullptr; }
    void deactivate();

    private:
        friend struct keyboard_broadcast;
        key_listener(std::shared_ptr<keyboard_broadcast> source, std::shared_ptr<keyboard_broadcast::listener_queue> queue):
            source_{std::move(source)}, queue_{std::move(queue)}
        {}

        std::optional<key_event> pop();

        std::shared_ptr<keyboard_broadcast> source_;
        std::shared_ptr<keyboard_broadcast::listener_queue> queue_;
};
