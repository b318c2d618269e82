#pragma once

#include <memory>
#include <mutex>

#include <glm/glm.hpp>

#include "geometry.hpp"
#include "renderable.hpp"
#include "window_handle.hpp"

namespace colors {
    inline const glm::vec4 black{0.0f, 0.0f, 0.0f, 1.0f};
    inline const glm::vec4 white{1.0f, 1.0f, 1.0f, 1.0f};
    inline const glm::vec4 gray {0.5f, 0.5f, 0.5f, 1.0f};
    inline const glm::vec4 red  {1.0f, 0.0f, 0.0f, 1.0f};
    inline const glm::vec4 green{0.0f, 1.0f, 0.0f, 1.0f};
    inline const glm::vec4 blue {0.0f, 0.0f, 1.0f, 1.0f};
}

// Uniformly coloured rectangle. Drawn as a scissored clear, so it touches
// nothing outside its own pixels.
struct patch_stimulus: renderable {
    patch_stimulus(const window_handle& win, const rectangle& rect, const glm::vec4& color);

    void set_color(const glm::vec4&);
    glm::vec4 color() const;
    void set_rect(const rectangle&);

    void prepare(gpu_device&, const texture_view&, const surface_config&) override;
    void render(command_encoder&, const texture_view&) override;

    private:
        std::shared_ptr<const display_geometry> geometry;
        mutable std::mutex mutex;
        rectangle rect;
        glm::vec4 fill;
        pixel_rect pixels;
};
