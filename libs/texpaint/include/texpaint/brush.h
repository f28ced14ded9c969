// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush settings
//

#pragma once

#include <optional>
#include <string>

#include <glm/vec4.hpp>

#include <texpaint/status.h>

namespace texpaint {

// Straight (non-premultiplied) RGBA, each channel in [0, 1]
using Color = glm::vec4;

enum class Brush_Type {
    Round = 0,
    Square,
    Airbrush,
    Stipple,
    Gradient,
};

enum class Blend_Mode {
    Normal = 0,
    Multiply,
    Screen,
    Overlay,
    Soft_Light,
    Hard_Light,
    Color_Dodge,
    Color_Burn,
};

constexpr float min_brush_size = 1.0f;
constexpr float max_brush_size = 100.0f;

struct Brush_Settings {
    Brush_Type type = Brush_Type::Round;

    Color primary_color = { 1, 0, 0, 1 };
    Color secondary_color = { 0, 0, 1, 1 };

    // Pixels, [1, 100]
    float size = 20;
    // [0, 1]
    float opacity = 1;
    // [0, 1]
    float flow = 1;
    // [0, 1], airbrush only
    float hardness = 0.5f;
    // [0, 1], stipple only
    float texture_strength = 0.5f;
    // Degrees, [0, 360), gradient only
    float gradient_angle = 0;

    Blend_Mode blend_mode = Blend_Mode::Normal;
    bool symmetry = false;
};

/**
 * Clamps every numeric field into its valid range. Out-of-range values are
 * never rejected. The gradient angle wraps around, NaNs become the lower
 * bound of the range.
 */
TEXPAINT_EXPORT Brush_Settings
sanitize(Brush_Settings const &settings);

/**
 * Changes the brush size by `delta` and clamps the result into [1, 100].
 */
TEXPAINT_EXPORT Brush_Settings
step_brush_size(Brush_Settings const &settings, float delta);

/**
 * Parses a CSS-style hex color: `#rgb`, `#rrggbb` or `#rrggbbaa`.
 * \return The color or std::nullopt if the string is malformed.
 */
TEXPAINT_EXPORT std::optional<Color>
parse_color(std::string const &str);

/** \brief Formats a color as `#rrggbb`; alpha is dropped. */
TEXPAINT_EXPORT std::string
to_hex_string(Color const &color);

TEXPAINT_EXPORT std::optional<Brush_Type>
brush_type_from_string(std::string const &id);

/**
 * Maps a blend mode identifier (`normal`, `source-over`, `multiply`,
 * `screen`, `overlay`, `soft-light`, `hard-light`, `color-dodge`,
 * `color-burn`) to a blend mode. Unknown identifiers map to Normal.
 */
TEXPAINT_EXPORT Blend_Mode
blend_mode_from_string(std::string const &id);

TEXPAINT_EXPORT char const *
to_string(Brush_Type type);

TEXPAINT_EXPORT char const *
to_string(Blend_Mode mode);

}
