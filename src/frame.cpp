#include "frame.hpp"

#include "utils.hpp"

void frame::add(std::shared_ptr<renderable> item) {
    if (!item) log_error("Cannot add an empty stimulus to a frame");
    std::lock_guard<std::mutex> lock{mutex_};
    items_.push_back(std::move(item));
}

void frame::clear() {
    std::lock_guard<std::mutex> lock{mutex_};
    items_.clear();
}

std::size_t frame::size() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return items_.size();
}

void frame::for_each(const std::function<void(renderable&)>& fn) {
    std::lock_guard<std::mutex> lock{mutex_};
    for (auto& item: items_) fn(*item);
}

std::uint64_t frame::index() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return index_;
}

void frame::set_index(std::uint64_t idx) {
    std::lock_guard<std::mutex> lock{mutex_};
    index_ = idx;
}
