// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: engine configuration
//

#pragma once

#include <cstdint>

#include <texpaint/status.h>
#include <texpaint/logger.h>

namespace texpaint {

enum class Projection_Mode {
    // Ray cast against the target's triangles
    Surface = 0,
    // Pointer maps 1:1 to paint buffer pixels
    Flat_Canvas,
};

struct Config {
    // Resolution of every paint buffer created by the engine
    unsigned buffer_width = 1024;
    unsigned buffer_height = 1024;

    // Number of stipple dots per sample at full texture strength
    unsigned stipple_density = 20;

    Projection_Mode projection = Projection_Mode::Surface;

    // Cursor opacity while the target-validity gate is closed
    float cursor_disabled_opacity = 0.5f;

    // Seed of the stipple scatter; zero means nondeterministic
    uint32_t rng_seed = 0;

    // Threads decoding base textures
    unsigned decode_threads = 1;

    // Used when the engine creates its own logger
    Severity log_level = Severity::Info;
};

// Largest accepted buffer edge length
constexpr unsigned max_buffer_dimension = 16384;

/**
 * Checks the configuration for invalid values.
 * \return Status::OK or Status::Invalid_Configuration
 */
TEXPAINT_EXPORT TEXPAINT_RETURN_CODE
validate(Config const &config);

}
