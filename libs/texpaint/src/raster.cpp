// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush rasterizer
//

#include "stdafx.h"
#include <texpaint/raster.h>

namespace gil = boost::gil;

namespace texpaint {

/*
    Every shape is rasterized by evaluating a coverage function at the pixel
    centers inside its bounding box. Coverage is the signed distance to the
    shape edge, shifted by half a pixel and clamped to [0, 1], which gives a
    one pixel wide anti-aliased edge.

    A shape composites each pixel at most once, so overlapping parts of a
    single polyline don't darken each other. Separate shapes (square dabs,
    stipple dots) do.
*/

struct Pixel_Rect {
    int x0, y0;
    int x1, y1;
};

static bool clip_rect(Pixel_View const &view, glm::vec2 const &min, glm::vec2 const &max, Pixel_Rect &out) {
    auto const width = float(view.width());
    auto const height = float(view.height());

    if (!(min.x < width && min.y < height && max.x >= 0 && max.y >= 0)) {
        return false;
    }

    out.x0 = int(glm::max(std::floor(min.x), 0.0f));
    out.y0 = int(glm::max(std::floor(min.y), 0.0f));
    out.x1 = int(glm::min(std::ceil(max.x), width));
    out.y1 = int(glm::min(std::ceil(max.y), height));

    return out.x0 < out.x1 && out.y0 < out.y1;
}

static float edge_coverage(float signed_distance) {
    return glm::clamp(signed_distance + 0.5f, 0.0f, 1.0f);
}

static float distance_to_segment(glm::vec2 const &p, glm::vec2 const &a, glm::vec2 const &b) {
    auto ab = b - a;
    auto len2 = dot(ab, ab);
    if (len2 <= 0) {
        return glm::length(p - a);
    }

    auto t = glm::clamp(dot(p - a, ab) / len2, 0.0f, 1.0f);
    return glm::length(p - (a + t * ab));
}

static float distance_to_polyline(glm::vec2 const &p, glm::vec2 const *points, size_t count) {
    if (count == 1) {
        return glm::length(p - points[0]);
    }

    auto ret = FLT_MAX;
    for (size_t i = 1; i < count; i++) {
        ret = glm::min(ret, distance_to_segment(p, points[i - 1], points[i]));
    }
    return ret;
}

template<typename Coverage, typename Shader>
static size_t fill_shape(
        Pixel_View const &view,
        glm::vec2 const &min, glm::vec2 const &max,
        Coverage const &coverage,
        Shader const &shade,
        Raster_Params const &params) {
    ZoneScoped;
    Pixel_Rect rect;
    if (!clip_rect(view, min, max, rect)) {
        return 0;
    }

    size_t written = 0;
    for (int y = rect.y0; y < rect.y1; y++) {
        for (int x = rect.x0; x < rect.x1; x++) {
            auto p = glm::vec2(x + 0.5f, y + 0.5f);
            auto cov = coverage(p);
            if (cov <= 0) {
                continue;
            }

            Color color = shade(p);
            auto alpha = color.a * cov * params.global_alpha;
            if (alpha <= 0) {
                continue;
            }

            auto &px = view(x, y);
            px = composite(px, color, alpha, params.blend_mode);
            written++;
        }
    }

    return written;
}

static size_t fill_circle(Pixel_View const &view, glm::vec2 const &center, float radius, Color const &color, Raster_Params const &params) {
    auto extent = glm::vec2(radius + 1);
    return fill_shape(
        view, center - extent, center + extent,
        [&](glm::vec2 const &p) { return edge_coverage(radius - glm::length(p - center)); },
        [&](glm::vec2 const &) { return color; },
        params);
}

template<typename Shader>
static size_t stroke_polyline(Pixel_View const &view, glm::vec2 const *points, size_t count, float width, Shader const &shade, Raster_Params const &params) {
    auto half_width = width / 2;
    auto min = points[0];
    auto max = points[0];
    for (size_t i = 1; i < count; i++) {
        min = glm::min(min, points[i]);
        max = glm::max(max, points[i]);
    }

    auto extent = glm::vec2(half_width + 1);
    // Round caps and joins fall out of the distance function
    return fill_shape(
        view, min - extent, max + extent,
        [&](glm::vec2 const &p) { return edge_coverage(half_width - distance_to_polyline(p, points, count)); },
        shade,
        params);
}

static Raster_Stats draw_round(Pixel_View const &view, glm::vec2 const *points, size_t count, Raster_Params const &params) {
    Raster_Stats ret;
    auto const &color = params.primary_color;

    if (count == 1) {
        ret.pixels_written = fill_circle(view, points[0], params.diameter / 2, color, params);
    } else {
        ret.pixels_written = stroke_polyline(
            view, points, count, params.diameter,
            [&](glm::vec2 const &) { return color; },
            params);
    }
    ret.primitives = 1;

    return ret;
}

static Raster_Stats draw_square(Pixel_View const &view, glm::vec2 const *points, size_t count, Raster_Params const &params) {
    Raster_Stats ret;
    auto half_size = params.diameter / 2;
    auto extent = glm::vec2(half_size + 1);
    auto const &color = params.primary_color;

    for (size_t i = 0; i < count; i++) {
        auto const &center = points[i];
        ret.pixels_written += fill_shape(
            view, center - extent, center + extent,
            [&](glm::vec2 const &p) {
                auto d = glm::abs(p - center);
                return edge_coverage(half_size - d.x) * edge_coverage(half_size - d.y);
            },
            [&](glm::vec2 const &) { return color; },
            params);
        ret.primitives++;
    }

    return ret;
}

static Raster_Stats draw_airbrush(Pixel_View const &view, glm::vec2 const *points, size_t count, Raster_Params const &params) {
    Raster_Stats ret;
    auto radius = params.diameter / 2;
    auto extent = glm::vec2(radius + 1);
    auto center_alpha = params.opacity * params.hardness;

    for (size_t i = 0; i < count; i++) {
        auto const &center = points[i];
        ret.pixels_written += fill_shape(
            view, center - extent, center + extent,
            [&](glm::vec2 const &p) { return edge_coverage(radius - glm::length(p - center)); },
            [&](glm::vec2 const &p) {
                // Radial gradient: alpha falls off linearly, hue stays
                auto t = radius > 0 ? glm::clamp(glm::length(p - center) / radius, 0.0f, 1.0f) : 1.0f;
                auto color = params.primary_color;
                color.a *= center_alpha * (1 - t);
                return color;
            },
            params);
        ret.primitives++;
    }

    return ret;
}

static Raster_Stats draw_stipple(Pixel_View const &view, glm::vec2 const *points, size_t count, Raster_Params const &params, std::mt19937 &rng) {
    Raster_Stats ret;
    auto const pi = glm::pi<float>();
    auto radius = params.diameter / 2;
    auto dots = unsigned(std::lround(params.texture_strength * params.stipple_density));
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    for (size_t i = 0; i < count; i++) {
        for (unsigned d = 0; d < dots; d++) {
            // Radius is uniform, not area-uniform: dots are denser near
            // the center.
            auto angle = unit(rng) * 2 * pi;
            auto distance = unit(rng) * radius;
            auto dot_radius = unit(rng) * 3 + 1;
            auto center = points[i] + distance * glm::vec2(glm::cos(angle), glm::sin(angle));

            ret.pixels_written += fill_circle(view, center, dot_radius, params.primary_color, params);
            ret.primitives++;
        }
    }

    return ret;
}

static Color mix_premultiplied(Color const &c0, Color const &c1, float t) {
    auto p0 = glm::vec3(c0) * c0.a;
    auto p1 = glm::vec3(c1) * c1.a;
    auto a = glm::mix(c0.a, c1.a, t);
    if (a <= 0) {
        return { 0, 0, 0, 0 };
    }
    return Color(glm::mix(p0, p1, t) / a, a);
}

static Raster_Stats draw_gradient(Pixel_View const &view, glm::vec2 const *points, size_t count, Raster_Params const &params) {
    Raster_Stats ret;
    if (count < 2) {
        return ret;
    }

    // The axis is anchored at the first sample of the stroke and spans one
    // brush diameter, whatever the length of the stroke.
    auto angle = glm::radians(params.gradient_angle);
    auto dir = glm::vec2(glm::cos(angle), glm::sin(angle));
    auto g0 = params.gradient_anchor - dir * params.diameter / 2.0f;
    auto g1 = params.gradient_anchor + dir * params.diameter / 2.0f;
    auto axis = g1 - g0;
    auto axis_len2 = dot(axis, axis);

    ret.pixels_written = stroke_polyline(
        view, points, count, params.diameter,
        [&](glm::vec2 const &p) {
            auto t = axis_len2 > 0 ? glm::clamp(dot(p - g0, axis) / axis_len2, 0.0f, 1.0f) : 0.0f;
            return mix_premultiplied(params.primary_color, params.secondary_color, t);
        },
        params);
    ret.primitives = 1;

    return ret;
}

float brush_diameter(float size, unsigned width, unsigned height) {
    return (size / 100.0f) * float(glm::min(width, height)) * 0.1f;
}

glm::vec2 uv_to_pixel(glm::vec2 const &uv, unsigned width, unsigned height) {
    return { uv.x * width, (1 - uv.y) * height };
}

Raster_Params make_raster_params(
    Brush_Settings const &settings,
    unsigned width, unsigned height,
    glm::vec2 const &gradient_anchor,
    unsigned stipple_density) {
    Raster_Params ret;

    ret.brush = settings.type;
    ret.blend_mode = settings.blend_mode;
    ret.primary_color = settings.primary_color;
    ret.secondary_color = settings.secondary_color;
    ret.diameter = brush_diameter(settings.size, width, height);
    ret.global_alpha = settings.opacity * settings.flow;
    ret.opacity = settings.opacity;
    ret.hardness = settings.hardness;
    ret.texture_strength = settings.texture_strength;
    ret.stipple_density = stipple_density;
    ret.gradient_anchor = gradient_anchor;
    ret.gradient_angle = settings.gradient_angle;

    return ret;
}

Raster_Stats rasterize(
    Pixel_View const &target,
    glm::vec2 const *points, size_t count,
    Raster_Params const &params,
    std::mt19937 &rng) {
    ZoneScoped;

    if (points == nullptr || count == 0 || params.global_alpha <= 0) {
        return {};
    }

    switch (params.brush) {
    case Brush_Type::Round:
        return draw_round(target, points, count, params);
    case Brush_Type::Square:
        return draw_square(target, points, count, params);
    case Brush_Type::Airbrush:
        return draw_airbrush(target, points, count, params);
    case Brush_Type::Stipple:
        return draw_stipple(target, points, count, params, rng);
    case Brush_Type::Gradient:
        return draw_gradient(target, points, count, params);
    }

    return {};
}

}
