#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "utils.hpp"

// Execution strategy handed down from startup: how tasks are spawned, how
// they sleep and how the host loop is asked for the next frame.
struct platform {
    virtual ~platform() = default;

    virtual void spawn(const std::string& name, std::function<void()> task) = 0;
    // Returns the time actually slept, shorter if interrupted by shutdown.
    virtual timer::duration sleep(timer::duration) = 0;
    virtual void request_frame() = 0;
    // Interrupts sleeps and joins every spawned task.
    virtual void shutdown() = 0;
    virtual bool stopping() const = 0;
};

// One thread per task. Headless: there is no host loop to wake.
struct thread_platform: platform {
    thread_platform() = default;
    thread_platform(const thread_platform&) = delete;
    thread_platform& operator=(const thread_platform&) = delete;
    ~thread_platform() override;

    void spawn(const std::string& name, std::function<void()> task) override;
    timer::duration sleep(timer::duration) override;
    void request_frame() override {}
    void shutdown() override;
    bool stopping() const override;

    std::size_t tasks() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable wake_;
        std::vector<std::thread> threads_;
        bool stopping_ = false;
};
