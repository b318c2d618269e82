#pragma once

#include "gpu.hpp"

// Contract for everything that can be placed into a frame. The render task
// calls `prepare` on every item of a frame before calling `render` on any of
// them; all `render` calls of one frame record into the same encoder, which
// loads the target instead of clearing it.
struct renderable {
    virtual ~renderable() = default;

    // Upload or refresh GPU side state; repeated calls with unchanged input must be harmless.
    virtual void prepare(gpu_device&, const texture_view&, const surface_config&) = 0;
    virtual void render(command_encoder&, const texture_view&) = 0;
};
