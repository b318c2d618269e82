#include "stimulus.hpp"

#include <glbinding/gl/gl.h>

#include "gl_device.hpp"

using namespace gl;

patch_stimulus::patch_stimulus(const window_handle& win, const rectangle& r, const glm::vec4& c):
    geometry{win.geometry()}, rect{r}, fill{c}
{}

void patch_stimulus::set_color(const glm::vec4& c) {
    std::lock_guard<std::mutex> lock{mutex};
    fill = c;
}

glm::vec4 patch_stimulus::color() const {
    std::lock_guard<std::mutex> lock{mutex};
    return fill;
}

void patch_stimulus::set_rect(const rectangle& r) {
    std::lock_guard<std::mutex> lock{mutex};
    rect = r;
}

void patch_stimulus::prepare(gpu_device&, const texture_view& target, const surface_config&) {
    std::lock_guard<std::mutex> lock{mutex};
    auto px = to_pixel_rect(rect, geometry->width_mm, geometry->viewing_distance_mm, target.width, target.height);
    pixels = clip(px, target.width, target.height);
}

void patch_stimulus::render(command_encoder& encoder, const texture_view& target) {
    std::lock_guard<std::mutex> lock{mutex};
    if (pixels.width == 0 || pixels.height == 0) return;
    encoder.record([p=pixels, c=fill, fb=target.framebuffer] {
        glBindFramebuffer(GL_FRAMEBUFFER, fb);
        glEnable(GL_SCISSOR_TEST);
        glScissor(p.x, p.y, p.width, p.height);
        glClearColor(c.r, c.g, c.b, c.a);
        glClear(GL_COLOR_BUFFER_BIT);
        glDisable(GL_SCISSOR_TEST);
        gl_check_error("patch_stimulus");
    });
}
