#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

double size::to_pixels(double width_mm, double viewing_distance_mm, int width_px, int height_px) const {
    switch (units) {
        case unit::pixels:
            return value;
        case unit::millimeters:
            return value/width_mm*width_px;
        case unit::degrees: {
            // Extent subtended by the angle at the viewing distance
            auto rad = value*std::numbers::pi/180.0;
            auto mm  = 2.0*viewing_distance_mm*std::tan(0.5*rad);
            return mm/width_mm*width_px;
        }
        case unit::screen_width:
            return value*width_px;
        case unit::screen_height:
            return value*height_px;
    }
    return value;
}

pixel_rect to_pixel_rect(const rectangle& r, double width_mm, double viewing_distance_mm, int width_px, int height_px) {
    auto px = [&](const size& s) { return s.to_pixels(width_mm, viewing_distance_mm, width_px, height_px); };
    auto w  = std::abs(px(r.width));
    auto h  = std::abs(px(r.height));
    auto cx = 0.5*width_px  + px(r.x);
    auto cy = 0.5*height_px + px(r.y);
    return {(int) std::lround(cx - 0.5*w),
            (int) std::lround(cy - 0.5*h),
            (int) std::lround(w),
            (int) std::lround(h)};
}

pixel_rect clip(const pixel_rect& r, int width_px, int height_px) {
    auto x0 = std::clamp(r.x, 0, width_px);
    auto y0 = std::clamp(r.y, 0, height_px);
    auto x1 = std::clamp(r.x + r.width,  0, width_px);
    auto y1 = std::clamp(r.y + r.height, 0, height_px);
    if (x1 <= x0 || y1 <= y0) return {};
    return {x0, y0, x1 - x0, y1 - y0};
}
