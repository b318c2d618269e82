#include "broadcast.hpp"

#include <algorithm>

keyboard_broadcast::keyboard_broadcast(std::size_t capacity): capacity_{capacity < 1 ? 1 : capacity} {}

std::size_t keyboard_broadcast::publish(const key_event& evt) {
    std::size_t reached = 0;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (closed_) return 0;
        for (auto& queue: listeners_) {
            if (queue->events.size() >= capacity_) {
                queue->events.pop_front();
                queue->dropped++;
            }
            queue->events.push_back(evt);
            reached++;
        }
    }
    if (reached) published_.notify_all();
    log_trace("Published key {} ({}) to {} listeners", evt.code, evt.state, reached);
    return reached;
}

key_listener keyboard_broadcast::listen() {
    auto queue = std::make_shared<listener_queue>();
    {
        std::lock_guard<std::mutex> lock{mutex_};
        listeners_.push_back(queue);
    }
    return key_listener{shared_from_this(), queue};
}

void keyboard_broadcast::deactivate(const std::shared_ptr<listener_queue>& queue) {
    std::lock_guard<std::mutex> lock{mutex_};
    std::erase(listeners_, queue);
}

void keyboard_broadcast::close() {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (closed_) return;
        closed_ = true;
    }
    log_debug("Closing keyboard broadcast");
    published_.notify_all();
}

bool keyboard_broadcast::closed() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return closed_;
}

std::size_t keyboard_broadcast::active_listeners() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return listeners_.size();
}

key_listener& key_listener::operator=(key_listener&& other) noexcept {
    if (this != &other) {
        deactivate();
        source_ = std::move(other.source_);
        queue_  = std::move(other.queue_);
    }
    return *this;
}

key_listener::~key_listener() { deactivate(); }

void key_listener::deactivate() {
    if (source_) source_->deactivate(queue_);
    source_.reset();
    queue_.reset();
}

// Caller holds the broadcast's mutex.
std::optional<key_event> key_listener::pop() {
    if (queue_->events.empty()) return {};
    auto evt = queue_->events.front();
    queue_->events.pop_front();
    return evt;
}

std::optional<key_event> key_listener::try_recv() {
    if (!source_) return {};
    std::lock_guard<std::mutex> lock{source_->mutex_};
    return pop();
}

std::optional<key_event> key_listener::recv() {
    if (!source_) return {};
    std::unique_lock<std::mutex> lock{source_->mutex_};
    source_->published_.wait(lock, [this] { return source_->closed_ || !queue_->events.empty(); });
    return pop();
}

std::optional<key_event> key_listener::recv_for(timer::duration timeout) {
    if (!source_) return {};
    std::unique_lock<std::mutex> lock{source_->mutex_};
    source_->published_.wait_for(lock, timeout, [this] { return source_->closed_ || !queue_->events.empty(); });
    return pop();
}

std::size_t key_listener::pending() const {
    if (!source_) return 0;
    std::lock_guard<std::mutex> lock{source_->mutex_};
    return queue_->events.size();
}

std::size_t key_listener::dropped() const {
    if (!source_) return 0;
    std::lock_guard<std::mutex> lock{source_->mutex_};
    return queue_->dropped;
}
