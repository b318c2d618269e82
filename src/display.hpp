#pragma once

#include <optional>
#include <vector>

#include <fmt/format.h>

struct video_mode {
    int width  = 0;
    int height = 0;
    int refresh_hz = 0;

    friend bool operator==(const video_mode&, const video_mode&) = default;
};

// Largest resolution, ties broken by the highest refresh rate.
std::optional<video_mode> select_video_mode(const std::vector<video_mode>& modes);

// `requested` if it names a connected monitor, otherwise empty (use the primary one).
std::optional<int> resolve_monitor(int requested, int count);

template <> struct fmt::formatter<video_mode>: fmt::formatter<std::string_view> {
    template <typename Ctx> auto format(const video_mode& m, Ctx& ctx) const {
        return fmt::format_to(ctx.out(), "{}x{} @ {} Hz", m.width, m.height, m.refresh_hz);
    }
};
