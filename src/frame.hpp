#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "renderable.hpp"

// One batch of stimuli shown together on a single refresh. Built by the
// experiment, consumed once by the render task; both sides go through the lock.
struct frame {
    frame() = default;
    frame(const frame&) = delete;
    frame& operator=(const frame&) = delete;

    void add(std::shared_ptr<renderable>);
    void clear();
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // Visits items in insertion order with the frame locked.
    void for_each(const std::function<void(renderable&)>&);

    std::uint64_t index() const;
    void set_index(std::uint64_t);

    private:
        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<renderable>> items_;
        std::uint64_t index_ = 0;
};

using shared_frame = std::shared_ptr<frame>;

inline shared_frame make_frame() { return std::make_shared<frame>(); }
