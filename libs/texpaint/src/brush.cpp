// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush settings
//

#include "stdafx.h"
#include <texpaint/brush.h>

#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace texpaint {

static float clamp_finite(float value, float lo, float hi) {
    if (std::isnan(value)) {
        return lo;
    }
    return glm::clamp(value, lo, hi);
}

static float wrap_angle(float degrees) {
    if (!std::isfinite(degrees)) {
        return 0;
    }

    auto wrapped = std::fmod(degrees, 360.0f);
    if (wrapped < 0) {
        wrapped += 360.0f;
    }
    // fmod of a tiny negative number plus 360 rounds to 360
    if (wrapped >= 360.0f) {
        wrapped = 0;
    }
    return wrapped;
}

static Color clamp_color(Color const &color) {
    return {
        clamp_finite(color.r, 0, 1),
        clamp_finite(color.g, 0, 1),
        clamp_finite(color.b, 0, 1),
        clamp_finite(color.a, 0, 1),
    };
}

Brush_Settings sanitize(Brush_Settings const &settings) {
    auto ret = settings;

    ret.primary_color = clamp_color(settings.primary_color);
    ret.secondary_color = clamp_color(settings.secondary_color);
    ret.size = clamp_finite(settings.size, min_brush_size, max_brush_size);
    ret.opacity = clamp_finite(settings.opacity, 0, 1);
    ret.flow = clamp_finite(settings.flow, 0, 1);
    ret.hardness = clamp_finite(settings.hardness, 0, 1);
    ret.texture_strength = clamp_finite(settings.texture_strength, 0, 1);
    ret.gradient_angle = wrap_angle(settings.gradient_angle);

    return ret;
}

Brush_Settings step_brush_size(Brush_Settings const &settings, float delta) {
    auto ret = settings;
    ret.size = clamp_finite(settings.size + delta, min_brush_size, max_brush_size);
    return ret;
}

static int hex_digit(char ch) {
    if ('0' <= ch && ch <= '9') {
        return ch - '0';
    }

    auto lower = std::tolower((unsigned char)ch);
    if ('a' <= lower && lower <= 'f') {
        return lower - 'a' + 10;
    }

    return -1;
}

std::optional<Color> parse_color(std::string const &str) {
    if (str.empty() || str[0] != '#') {
        return std::nullopt;
    }

    int digits[8];
    auto len = str.size() - 1;
    if (len != 3 && len != 6 && len != 8) {
        return std::nullopt;
    }

    for (size_t i = 0; i < len; i++) {
        digits[i] = hex_digit(str[i + 1]);
        if (digits[i] < 0) {
            return std::nullopt;
        }
    }

    Color ret(0, 0, 0, 1);
    if (len == 3) {
        // #rgb is shorthand for #rrggbb
        for (int c = 0; c < 3; c++) {
            ret[c] = (digits[c] * 16 + digits[c]) / 255.0f;
        }
    } else {
        auto channels = len / 2;
        for (size_t c = 0; c < channels; c++) {
            ret[c] = (digits[c * 2] * 16 + digits[c * 2 + 1]) / 255.0f;
        }
    }

    return ret;
}

std::string to_hex_string(Color const &color) {
    char buf[8];
    auto c = clamp_color(color);
    snprintf(
        buf, sizeof(buf), "#%02x%02x%02x",
        (unsigned)std::lround(c.r * 255),
        (unsigned)std::lround(c.g * 255),
        (unsigned)std::lround(c.b * 255));
    return buf;
}

std::optional<Brush_Type> brush_type_from_string(std::string const &id) {
    static std::unordered_map<std::string, Brush_Type> const types = {
        { "round", Brush_Type::Round },
        { "square", Brush_Type::Square },
        { "airbrush", Brush_Type::Airbrush },
        { "stipple", Brush_Type::Stipple },
        { "gradient", Brush_Type::Gradient },
    };

    auto it = types.find(id);
    if (it == types.end()) {
        return std::nullopt;
    }

    return it->second;
}

Blend_Mode blend_mode_from_string(std::string const &id) {
    static std::unordered_map<std::string, Blend_Mode> const modes = {
        { "normal", Blend_Mode::Normal },
        { "source-over", Blend_Mode::Normal },
        { "multiply", Blend_Mode::Multiply },
        { "screen", Blend_Mode::Screen },
        { "overlay", Blend_Mode::Overlay },
        { "soft-light", Blend_Mode::Soft_Light },
        { "hard-light", Blend_Mode::Hard_Light },
        { "color-dodge", Blend_Mode::Color_Dodge },
        { "color-burn", Blend_Mode::Color_Burn },
    };

    auto it = modes.find(id);
    if (it == modes.end()) {
        return Blend_Mode::Normal;
    }

    return it->second;
}

char const *to_string(Brush_Type type) {
    switch (type) {
    case Brush_Type::Round: return "round";
    case Brush_Type::Square: return "square";
    case Brush_Type::Airbrush: return "airbrush";
    case Brush_Type::Stipple: return "stipple";
    case Brush_Type::Gradient: return "gradient";
    }

    return "round";
}

char const *to_string(Blend_Mode mode) {
    switch (mode) {
    case Blend_Mode::Normal: return "normal";
    case Blend_Mode::Multiply: return "multiply";
    case Blend_Mode::Screen: return "screen";
    case Blend_Mode::Overlay: return "overlay";
    case Blend_Mode::Soft_Light: return "soft-light";
    case Blend_Mode::Hard_Light: return "hard-light";
    case Blend_Mode::Color_Dodge: return "color-dodge";
    case Blend_Mode::Color_Burn: return "color-burn";
    }

    return "normal";
}

}
