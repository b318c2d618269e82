#include "platform.hpp"

#include <exception>

#include "channel.hpp"

thread_platform::~thread_platform() { shutdown(); }

void thread_platform::spawn(const std::string& name, std::function<void()> task) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (stopping_) log_error("Cannot spawn task '{}' during shutdown", name);
    threads_.emplace_back([name, task=std::move(task)] {
        log_debug("Task '{}' running on thread {}", name, thread_name());
        try {
            task();
            log_debug("Task '{}' finished", name);
        }
        catch (const channel_closed& e) {
            log_debug("Task '{}' stopped: {}", name, e.what());
        }
        catch (const std::exception& e) {
            log_critical("Task '{}' failed: {}", name, e.what());
        }
    });
}

timer::duration thread_platform::sleep(timer::duration dt) {
    auto t0 = timer::now();
    std::unique_lock<std::mutex> lock{mutex_};
    wake_.wait_until(lock, t0 + dt, [this] { return stopping_; });
    return timer::now() - t0;
}

void thread_platform::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        stopping_ = true;
        threads.swap(threads_);
    }
    wake_.notify_all();
    if (!threads.empty()) log_debug("Joining {} tasks", threads.size());
    for (auto& thread: threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
            continue;
        }
        if (thread.joinable()) thread.join();
    }
}

bool thread_platform::stopping() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return stopping_;
}

std::size_t thread_platform::tasks() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return threads_.size();
}
