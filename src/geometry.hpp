#pragma once

// Physical units for stimulus layout. Conversion to pixels needs the display
// width in millimeters, the viewing distance and the surface size.

enum class unit { pixels, millimeters, degrees, screen_width, screen_height };

struct size {
    double value = 0.0;
    unit   units = unit::pixels;

    static size pixels(double v)        { return {v, unit::pixels}; }
    static size millimeters(double v)   { return {v, unit::millimeters}; }
    static size degrees(double v)       { return {v, unit::degrees}; }
    static size screen_width(double v)  { return {v, unit::screen_width}; }
    static size screen_height(double v) { return {v, unit::screen_height}; }

    double to_pixels(double width_mm, double viewing_distance_mm, int width_px, int height_px) const;

    size operator-() const { return {-value, units}; }
};

// Centered coordinates: origin in the middle of the screen, y pointing up.
struct rectangle {
    size x      = size::pixels(0);
    size y      = size::pixels(0);
    size width  = size::pixels(0);
    size height = size::pixels(0);

    static rectangle fullscreen() {
        return {size::pixels(0), size::pixels(0), size::screen_width(1.0), size::screen_height(1.0)};
    }
};

// Window coordinates with the origin at the bottom left, as OpenGL expects.
struct pixel_rect {
    int x = 0, y = 0, width = 0, height = 0;

    friend bool operator==(const pixel_rect&, const pixel_rect&) = default;
};

pixel_rect to_pixel_rect(const rectangle& r, double width_mm, double viewing_distance_mm, int width_px, int height_px);

// Clipped to the surface; empty if nothing is visible.
pixel_rect clip(const pixel_rect& r, int width_px, int height_px);
