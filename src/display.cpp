#include "display.hpp"

#include <algorithm>
#include <tuple>

std::optional<video_mode> select_video_mode(const std::vector<video_mode>& modes) {
    if (modes.empty()) return {};
    auto key = [](const video_mode& m) { return std::make_tuple((long) m.width*m.height, m.width, m.refresh_hz); };
    return *std::max_element(modes.begin(), modes.end(),
                             [&](const auto& l, const auto& r) { return key(l) < key(r); });
}

std::optional<int> resolve_monitor(int requested, int count) {
    if (requested < 0 || requested >= count) return {};
    return requested;
}
