// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: separable blend modes and source-over compositing
//

#include "stdafx.h"
#include <texpaint/raster.h>

namespace gil = boost::gil;

namespace texpaint {

static float multiply(float cb, float cs) {
    return cb * cs;
}

static float screen(float cb, float cs) {
    return cb + cs - cb * cs;
}

static float hard_light(float cb, float cs) {
    if (cs <= 0.5f) {
        return multiply(cb, 2 * cs);
    } else {
        return screen(cb, 2 * cs - 1);
    }
}

static float soft_light(float cb, float cs) {
    if (cs <= 0.5f) {
        return cb - (1 - 2 * cs) * cb * (1 - cb);
    }

    float d;
    if (cb <= 0.25f) {
        d = ((16 * cb - 12) * cb + 4) * cb;
    } else {
        d = glm::sqrt(cb);
    }

    return cb + (2 * cs - 1) * (d - cb);
}

static float color_dodge(float cb, float cs) {
    if (cb <= 0) {
        return 0;
    }
    if (cs >= 1) {
        return 1;
    }
    return glm::min(1.0f, cb / (1 - cs));
}

static float color_burn(float cb, float cs) {
    if (cb >= 1) {
        return 1;
    }
    if (cs <= 0) {
        return 0;
    }
    return 1 - glm::min(1.0f, (1 - cb) / cs);
}

static float blend(Blend_Mode mode, float cb, float cs) {
    switch (mode) {
    case Blend_Mode::Normal: return cs;
    case Blend_Mode::Multiply: return multiply(cb, cs);
    case Blend_Mode::Screen: return screen(cb, cs);
    case Blend_Mode::Overlay: return hard_light(cs, cb);
    case Blend_Mode::Soft_Light: return soft_light(cb, cs);
    case Blend_Mode::Hard_Light: return hard_light(cb, cs);
    case Blend_Mode::Color_Dodge: return color_dodge(cb, cs);
    case Blend_Mode::Color_Burn: return color_burn(cb, cs);
    }

    return cs;
}

static float to_unit(std::uint8_t v) {
    return v / 255.0f;
}

static std::uint8_t to_bits8(float v) {
    return std::uint8_t(std::lround(glm::clamp(v, 0.0f, 1.0f) * 255));
}

Pixel composite(Pixel const &dst, Color const &src, float alpha, Blend_Mode mode) {
    auto as = glm::clamp(alpha, 0.0f, 1.0f);
    if (!(as > 0)) {
        return dst;
    }

    float const cb[3] = {
        to_unit(gil::get_color(dst, gil::red_t())),
        to_unit(gil::get_color(dst, gil::green_t())),
        to_unit(gil::get_color(dst, gil::blue_t())),
    };
    auto ab = to_unit(gil::get_color(dst, gil::alpha_t()));
    auto ao = as + ab * (1 - as);

    // Straight alpha in, straight alpha out. The blend function only applies
    // where the backdrop is opaque; elsewhere the source shows through as-is.
    float out[3];
    for (int c = 0; c < 3; c++) {
        auto cs = glm::clamp(src[c], 0.0f, 1.0f);
        auto mixed = (1 - ab) * cs + ab * blend(mode, cb[c], cs);
        auto premultiplied = as * mixed + (1 - as) * ab * cb[c];
        out[c] = premultiplied / ao;
    }

    return Pixel(to_bits8(out[0]), to_bits8(out[1]), to_bits8(out[2]), to_bits8(ao));
}

}
