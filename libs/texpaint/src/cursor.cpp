// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush cursor indicator
//

#include "stdafx.h"
#include <texpaint/cursor.h>

namespace texpaint {

Cursor_Indicator compute_cursor(
    glm::vec2 const &pointer,
    Brush_Settings const &settings,
    bool gate_open,
    float disabled_opacity) {
    Cursor_Indicator ret;
    auto clean = sanitize(settings);

    ret.shape = clean.type == Brush_Type::Round ? Cursor_Shape::Circle : Cursor_Shape::Square;
    ret.center = pointer;
    ret.size = clean.size;
    ret.enabled = gate_open;
    ret.opacity = gate_open ? 1.0f : glm::clamp(disabled_opacity, 0.0f, 1.0f);

    ret.border_color.a *= ret.opacity;
    ret.fill_color.a *= ret.opacity;

    return ret;
}

}
