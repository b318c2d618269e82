#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "utils.hpp"

// Raised by blocking channel operations once the other side has gone away.
// Tasks treat it as the shutdown signal.
struct channel_closed: std::runtime_error {
    explicit channel_closed(const std::string& what): std::runtime_error{what} {}
};

// Bounded queue shared between tasks. `send` blocks while the channel holds
// `capacity` items, `recv` blocks while it is empty. After `close` buffered
// items can still be received, then every operation raises `channel_closed`.
template <typename T>
struct channel {
    explicit channel(std::size_t capacity, std::string name="channel"):
        capacity_{capacity < 1 ? 1 : capacity}, name_{std::move(name)}
    {}

    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    void send(T item) {
        std::unique_lock<std::mutex> lock{mutex_};
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) throw channel_closed{name_ + ": send on closed channel"};
        queue_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
    }

    // Never blocks; false if the channel is full or closed.
    bool try_send(T item) {
        std::unique_lock<std::mutex> lock{mutex_};
        if (closed_ || queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    T recv() {
        std::unique_lock<std::mutex> lock{mutex_};
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) throw channel_closed{name_ + ": recv on closed channel"};
        return pop(lock);
    }

    std::optional<T> try_recv() {
        std::unique_lock<std::mutex> lock{mutex_};
        if (queue_.empty()) return {};
        return pop(lock);
    }

    // Waits at most `timeout`; empty result on timeout.
    template <typename Rep, typename Period>
    std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock{mutex_};
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) return {};
        if (queue_.empty()) throw channel_closed{name_ + ": recv on closed channel"};
        return pop(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock{mutex_};
            if (closed_) return;
            closed_ = true;
        }
        log_debug("Closing {}", name_);
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }
    const std::string& name() const { return name_; }

    private:
        T pop(std::unique_lock<std::mutex>& lock) {
            T item = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            not_full_.notify_one();
            return item;
        }

        const std::size_t capacity_;
        const std::string name_;
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<T> queue_;
        bool closed_ = false;
};
