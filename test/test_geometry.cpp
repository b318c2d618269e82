#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

#include "geometry.hpp"

// 400 mm wide display at 1000 px, viewed from 500 mm
constexpr double width_mm = 400, distance_mm = 500;
constexpr int width_px = 1000, height_px = 800;

TEST(geometry, unit_conversion) {
    EXPECT_DOUBLE_EQ(size::pixels(12).to_pixels(width_mm, distance_mm, width_px, height_px), 12);
    EXPECT_DOUBLE_EQ(size::millimeters(40).to_pixels(width_mm, distance_mm, width_px, height_px), 100);
    EXPECT_DOUBLE_EQ(size::screen_width(0.5).to_pixels(width_mm, distance_mm, width_px, height_px), 500);
    EXPECT_DOUBLE_EQ(size::screen_height(0.25).to_pixels(width_mm, distance_mm, width_px, height_px), 200);
}

TEST(geometry, degrees_of_visual_angle) {
    // 2 * 500 * tan(0.5 deg) mm
    auto expected_mm = 1000.0*std::tan(0.5*std::numbers::pi/180.0);
    EXPECT_NEAR(size::degrees(1).to_pixels(width_mm, distance_mm, width_px, height_px), expected_mm/width_mm*width_px, 1e-9);
    EXPECT_NEAR((-size::degrees(1)).to_pixels(width_mm, distance_mm, width_px, height_px), -expected_mm/width_mm*width_px, 1e-9);
}

TEST(geometry, fullscreen_covers_surface) {
    auto px = to_pixel_rect(rectangle::fullscreen(), width_mm, distance_mm, width_px, height_px);
    EXPECT_EQ(px, (pixel_rect{0, 0, width_px, height_px}));
}

TEST(geometry, centred_coordinates_point_up) {
    rectangle r{size::pixels(100), size::pixels(50), size::pixels(20), size::pixels(10)};
    auto px = to_pixel_rect(r, width_mm, distance_mm, width_px, height_px);
    EXPECT_EQ(px, (pixel_rect{590, 445, 20, 10}));
}

TEST(geometry, clip_to_surface) {
    EXPECT_EQ(clip({-10, -10, 30, 30}, 100, 100), (pixel_rect{0, 0, 20, 20}));
    EXPECT_EQ(clip({90, 95, 30, 30}, 100, 100), (pixel_rect{90, 95, 10, 5}));
    EXPECT_EQ(clip({200, 0, 10, 10}, 100, 100), pixel_rect{});
    EXPECT_EQ(clip({10, 10, 0, 5}, 100, 100), pixel_rect{});
}
