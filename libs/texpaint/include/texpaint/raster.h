// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush rasterizer
//

#pragma once

#include <cstddef>
#include <random>

#include <glm/vec2.hpp>

#include <texpaint/brush.h>
#include <texpaint/texture.h>

namespace texpaint {

/**
 * \brief Everything a rasterization call needs. Compositing state is passed
 * explicitly instead of living in the target buffer.
 */
struct Raster_Params {
    Brush_Type brush = Brush_Type::Round;
    Blend_Mode blend_mode = Blend_Mode::Normal;

    Color primary_color = { 0, 0, 0, 1 };
    Color secondary_color = { 1, 1, 1, 1 };

    /** Brush diameter in pixels */
    float diameter = 1;
    /** Multiplies the alpha of every primitive (opacity * flow) */
    float global_alpha = 1;

    /** Airbrush center alpha is opacity * hardness */
    float opacity = 1;
    float hardness = 1;

    /** Stipple dots per sample is round(texture_strength * stipple_density) */
    float texture_strength = 0;
    unsigned stipple_density = 20;

    /** Gradient axis: anchored here, rotated by gradient_angle degrees */
    glm::vec2 gradient_anchor = { 0, 0 };
    float gradient_angle = 0;
};

struct Raster_Stats {
    /** Number of filled shapes (dabs, squares, dots, polylines) */
    size_t primitives = 0;
    /** Number of pixel writes */
    size_t pixels_written = 0;
};

/**
 * Brush diameter in pixels for a given brush size and buffer resolution:
 * `(size / 100) * min(width, height) * 0.1`.
 */
TEXPAINT_EXPORT float
brush_diameter(float size, unsigned width, unsigned height);

/**
 * Converts a texture coordinate into pixel space (Y is flipped).
 */
TEXPAINT_EXPORT glm::vec2
uv_to_pixel(glm::vec2 const &uv, unsigned width, unsigned height);

/**
 * Builds raster parameters from a settings snapshot.
 * \param settings Sanitized brush settings
 * \param width Width of the target buffer
 * \param height Height of the target buffer
 * \param gradient_anchor First sample of the stroke in pixel space
 * \param stipple_density Dots per sample at full texture strength
 */
TEXPAINT_EXPORT Raster_Params
make_raster_params(
    Brush_Settings const &settings,
    unsigned width, unsigned height,
    glm::vec2 const &gradient_anchor,
    unsigned stipple_density);

/**
 * Draws a sequence of pixel space points into `target` using the brush
 * algorithm in `params`.
 *
 * \param target Destination buffer
 * \param points Pixel space points
 * \param count Number of points
 * \param params Brush and compositing parameters
 * \param rng Random source of the stipple brush
 * \return Number of primitives and pixels drawn
 */
TEXPAINT_EXPORT Raster_Stats
rasterize(
    Pixel_View const &target,
    glm::vec2 const *points, size_t count,
    Raster_Params const &params,
    std::mt19937 &rng);

/**
 * Composites a source color with the given alpha over a destination pixel.
 * \param dst Backdrop
 * \param src Source color; its alpha is ignored
 * \param alpha Source alpha in [0, 1]
 * \param mode Blend mode
 * \return The resulting pixel
 */
TEXPAINT_EXPORT Pixel
composite(Pixel const &dst, Color const &src, float alpha, Blend_Mode mode);

}
