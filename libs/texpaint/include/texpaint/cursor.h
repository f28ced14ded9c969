// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush cursor indicator
//

#pragma once

#include <glm/vec2.hpp>

#include <texpaint/brush.h>

namespace texpaint {

enum class Cursor_Shape {
    Circle,
    Square,
};

/**
 * \brief Overlay geometry of the brush preview, in pointer coordinates.
 */
struct Cursor_Indicator {
    Cursor_Shape shape = Cursor_Shape::Circle;
    glm::vec2 center = { 0, 0 };
    // Diameter of the circle or side of the square
    float size = 0;
    // 1 while painting is possible, reduced otherwise
    float opacity = 1;
    bool enabled = false;

    Color border_color = { 1, 1, 1, 0.8f };
    float border_width = 2;
    Color fill_color = { 1, 1, 1, 0.1f };
};

/**
 * Computes the cursor indicator for a pointer position.
 * \param pointer Pointer position
 * \param settings Live brush settings
 * \param gate_open Whether the target-validity gate is open
 * \param disabled_opacity Opacity used while the gate is closed
 */
TEXPAINT_EXPORT Cursor_Indicator
compute_cursor(
    glm::vec2 const &pointer,
    Brush_Settings const &settings,
    bool gate_open,
    float disabled_opacity);

}
