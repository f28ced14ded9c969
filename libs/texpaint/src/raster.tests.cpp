// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush rasterizer tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/raster.h>
#include "test_scene.h"

using namespace texpaint;
using namespace texpaint::test;

namespace gil = boost::gil;

static Raster_Params make_params(Brush_Type type, float size = 20, unsigned dim = 1024) {
    Brush_Settings settings;
    settings.type = type;
    settings.size = size;
    return make_raster_params(settings, dim, dim, { dim / 2.0f, dim / 2.0f }, 20);
}

static double sum_alpha(Pixel_View const &view) {
    double ret = 0;
    for (int y = 0; y < view.height(); y++) {
        for (int x = 0; x < view.width(); x++) {
            ret += alpha_at(view, x, y) / 255.0;
        }
    }
    return ret;
}

TEST_CASE("Brush diameter") {
    REQUIRE(brush_diameter(20, 1024, 1024) == Approx(20.48f));
    REQUIRE(brush_diameter(100, 1024, 512) == Approx(51.2f));

    SECTION("is monotonic in size") {
        auto prev = brush_diameter(1, 1024, 1024);
        for (int s = 2; s <= 100; s++) {
            auto d = brush_diameter(float(s), 1024, 1024);
            REQUIRE(prev <= d);
            prev = d;
        }
    }
}

TEST_CASE("Texture coordinates map to pixels with a flipped Y axis") {
    REQUIRE(uv_to_pixel({ 0, 0 }, 1024, 512) == glm::vec2(0, 512));
    REQUIRE(uv_to_pixel({ 1, 1 }, 1024, 512) == glm::vec2(1024, 0));
    REQUIRE(uv_to_pixel({ 0.5f, 0.25f }, 1024, 1024) == glm::vec2(512, 768));
}

TEST_CASE("Raster parameters from settings") {
    Brush_Settings settings;
    settings.opacity = 0.5f;
    settings.flow = 0.5f;
    settings.size = 50;

    auto params = make_raster_params(settings, 1024, 1024, { 3, 4 }, 20);
    REQUIRE(params.global_alpha == Approx(0.25f));
    REQUIRE(params.diameter == Approx(51.2f));
    REQUIRE(params.gradient_anchor == glm::vec2(3, 4));
    REQUIRE(params.stipple_density == 20);
}

TEST_CASE("Round dab in the center of the buffer") {
    Image image(1024, 1024);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Round);
    REQUIRE(params.diameter == Approx(20.48f));

    glm::vec2 center(512, 512);
    auto stats = rasterize(view, &center, 1, params, rng);
    REQUIRE(stats.primitives == 1);
    REQUIRE(stats.pixels_written > 0);

    // Opaque red inside, untouched outside the radius
    REQUIRE(red_at(view, 512, 512) == 255);
    REQUIRE(green_at(view, 512, 512) == 0);
    REQUIRE(alpha_at(view, 512, 512) == 255);
    REQUIRE(alpha_at(view, 521, 512) == 255);
    REQUIRE(alpha_at(view, 512, 503) == 255);
    REQUIRE(alpha_at(view, 523, 512) == 0);
    REQUIRE(alpha_at(view, 500, 512) == 0);
    REQUIRE(alpha_at(view, 520, 520) == 0);

    // Covered area matches a circle of diameter 20.48
    auto r = 20.48 / 2;
    auto area = glm::pi<double>() * r * r;
    REQUIRE(sum_alpha(view) == Approx(area).epsilon(0.02));
}

TEST_CASE("Two point round stroke is connected") {
    Image image(1024, 1024);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Round);
    glm::vec2 points[2] = { { 400, 500 }, { 420, 500 } };
    auto stats = rasterize(view, points, 2, params, rng);

    REQUIRE(stats.primitives == 1);
    for (int x = 400; x <= 420; x++) {
        REQUIRE(alpha_at(view, x, 500) == 255);
        REQUIRE(alpha_at(view, x, 505) == 255);
    }
    // Round caps
    REQUIRE(alpha_at(view, 392, 500) == 255);
    REQUIRE(alpha_at(view, 386, 500) == 0);
}

TEST_CASE("Square dab") {
    Image image(256, 256);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    // Diameter is 100/100 * 256 * 0.1 = 25.6
    auto params = make_params(Brush_Type::Square, 100, 256);
    glm::vec2 center(128, 128);
    auto stats = rasterize(view, &center, 1, params, rng);
    REQUIRE(stats.primitives == 1);

    // Corners are filled, unlike a round dab
    REQUIRE(alpha_at(view, 128 + 11, 128 + 11) == 255);
    REQUIRE(alpha_at(view, 128 - 12, 128 - 12) == 255);
    REQUIRE(alpha_at(view, 128 + 14, 128) == 0);
    REQUIRE(alpha_at(view, 128, 128 - 15) == 0);
}

TEST_CASE("Square brush stamps every sample without interpolation") {
    Image image(256, 256);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Square, 20, 256);
    glm::vec2 points[2] = { { 50, 50 }, { 150, 50 } };
    auto stats = rasterize(view, points, 2, params, rng);

    REQUIRE(stats.primitives == 2);
    REQUIRE(alpha_at(view, 50, 50) == 255);
    REQUIRE(alpha_at(view, 150, 50) == 255);
    REQUIRE(alpha_at(view, 100, 50) == 0);
}

TEST_CASE("Airbrush falls off towards the edge") {
    Image image(1024, 1024);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    Brush_Settings settings;
    settings.type = Brush_Type::Airbrush;
    settings.size = 50;
    settings.hardness = 0.5f;
    auto params = make_raster_params(settings, 1024, 1024, { 0, 0 }, 20);

    glm::vec2 center(512, 512);
    auto stats = rasterize(view, &center, 1, params, rng);
    REQUIRE(stats.primitives == 1);

    // Center alpha is opacity * hardness
    auto a_center = alpha_at(view, 512, 512);
    REQUIRE(a_center <= 128);
    REQUIRE(a_center >= 110);

    auto a_mid = alpha_at(view, 524, 512);
    REQUIRE(0 < a_mid);
    REQUIRE(a_mid < a_center);

    REQUIRE(alpha_at(view, 512 + 27, 512) == 0);

    // Hue stays constant
    REQUIRE(red_at(view, 512, 512) == 255);
    REQUIRE(red_at(view, 524, 512) == 255);
    REQUIRE(blue_at(view, 524, 512) == 0);
}

TEST_CASE("Stipple dot count") {
    Image image(1024, 1024);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Stipple);
    glm::vec2 center(512, 512);

    SECTION("half strength") {
        params.texture_strength = 0.5f;
        REQUIRE(rasterize(view, &center, 1, params, rng).primitives == 10);
    }

    SECTION("full strength") {
        params.texture_strength = 1;
        REQUIRE(rasterize(view, &center, 1, params, rng).primitives == 20);
    }

    SECTION("rounds to the nearest integer") {
        params.texture_strength = 0.37f;
        REQUIRE(rasterize(view, &center, 1, params, rng).primitives == 7);
    }

    SECTION("per sample") {
        params.texture_strength = 0.5f;
        glm::vec2 points[3] = { { 100, 100 }, { 200, 200 }, { 300, 300 } };
        REQUIRE(rasterize(view, points, 3, params, rng).primitives == 30);
    }

    SECTION("custom density") {
        params.texture_strength = 0.5f;
        params.stipple_density = 40;
        REQUIRE(rasterize(view, &center, 1, params, rng).primitives == 20);
    }
}

TEST_CASE("Stipple dots stay near the sample") {
    Image image(1024, 1024);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Stipple);
    params.texture_strength = 1;
    glm::vec2 center(512, 512);
    auto stats = rasterize(view, &center, 1, params, rng);
    REQUIRE(stats.pixels_written > 0);

    // Dot centers are within d/2 of the sample, dot radius is below 4
    auto reach = params.diameter / 2 + 4 + 1;
    for (int y = 0; y < 1024; y++) {
        for (int x = 0; x < 1024; x++) {
            if (alpha_at(view, x, y) != 0) {
                auto d = glm::length(glm::vec2(x + 0.5f, y + 0.5f) - center);
                REQUIRE(d <= reach);
            }
        }
    }
}

TEST_CASE("Stipple scatter is reproducible with the same seed") {
    Image image0(256, 256), image1(256, 256);
    gil::fill_pixels(gil::view(image0), Pixel(0, 0, 0, 0));
    gil::fill_pixels(gil::view(image1), Pixel(0, 0, 0, 0));
    std::mt19937 rng0(42), rng1(42);

    auto params = make_params(Brush_Type::Stipple, 100, 256);
    params.texture_strength = 1;
    glm::vec2 center(128, 128);
    rasterize(gil::view(image0), &center, 1, params, rng0);
    rasterize(gil::view(image1), &center, 1, params, rng1);

    REQUIRE(gil::equal_pixels(gil::const_view(image0), gil::const_view(image1)));
}

TEST_CASE("Gradient needs two samples") {
    Image image(256, 256);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Gradient, 100, 256);
    glm::vec2 center(128, 128);
    auto stats = rasterize(view, &center, 1, params, rng);

    REQUIRE(stats.primitives == 0);
    REQUIRE(stats.pixels_written == 0);
    REQUIRE(is_transparent(view));
}

TEST_CASE("Gradient blends primary into secondary along its axis") {
    Image image(256, 256);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    // Diameter is 25.6, the axis runs from x = 128 - 12.8 to 128 + 12.8
    auto params = make_params(Brush_Type::Gradient, 100, 256);
    params.gradient_anchor = { 128, 128 };
    params.gradient_angle = 0;
    params.primary_color = { 1, 0, 0, 1 };
    params.secondary_color = { 0, 0, 1, 1 };

    glm::vec2 points[2] = { { 80, 128 }, { 180, 128 } };
    auto stats = rasterize(view, points, 2, params, rng);
    REQUIRE(stats.primitives == 1);

    // Padded beyond the ends
    REQUIRE(red_at(view, 90, 128) == 255);
    REQUIRE(blue_at(view, 90, 128) == 0);
    REQUIRE(red_at(view, 170, 128) == 0);
    REQUIRE(blue_at(view, 170, 128) == 255);

    // Halfway at the anchor
    REQUIRE(red_at(view, 128, 128) == Approx(128).margin(12));
    REQUIRE(blue_at(view, 128, 128) == Approx(128).margin(12));
    REQUIRE(alpha_at(view, 128, 128) == 255);
}

TEST_CASE("Zero global alpha draws nothing") {
    Image image(256, 256);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Round, 100, 256);
    params.global_alpha = 0;
    glm::vec2 center(128, 128);
    rasterize(view, &center, 1, params, rng);

    REQUIRE(is_transparent(view));
}

TEST_CASE("Shapes are clipped to the buffer") {
    Image image(64, 64);
    auto view = gil::view(image);
    gil::fill_pixels(view, Pixel(0, 0, 0, 0));
    std::mt19937 rng(1);

    auto params = make_params(Brush_Type::Round, 100, 64);
    params.diameter = 40;

    glm::vec2 corner(0, 0);
    auto stats = rasterize(view, &corner, 1, params, rng);
    REQUIRE(stats.pixels_written > 0);
    REQUIRE(alpha_at(view, 0, 0) == 255);

    glm::vec2 outside(-500, -500);
    stats = rasterize(view, &outside, 1, params, rng);
    REQUIRE(stats.pixels_written == 0);
}

TEST_CASE("Compositing over a transparent pixel") {
    Pixel transparent(0, 0, 0, 0);
    Color red(1, 0, 0, 1);

    auto px = composite(transparent, red, 1, Blend_Mode::Normal);
    REQUIRE(px == Pixel(255, 0, 0, 255));

    // Without a backdrop every blend mode shows the source
    for (int m = 0; m <= int(Blend_Mode::Color_Burn); m++) {
        REQUIRE(composite(transparent, red, 1, Blend_Mode(m)) == Pixel(255, 0, 0, 255));
    }

    auto half = composite(transparent, red, 0.5f, Blend_Mode::Normal);
    REQUIRE(gil::get_color(half, gil::red_t()) == 255);
    REQUIRE(int(gil::get_color(half, gil::alpha_t())) == Approx(128).margin(1));
}

TEST_CASE("Zero alpha leaves the pixel untouched") {
    Pixel dst(10, 20, 30, 40);
    REQUIRE(composite(dst, { 1, 1, 1, 1 }, 0, Blend_Mode::Normal) == dst);
    REQUIRE(composite(dst, { 1, 1, 1, 1 }, 0, Blend_Mode::Screen) == dst);
}

TEST_CASE("Source-over with half alpha") {
    Pixel white(255, 255, 255, 255);
    auto px = composite(white, { 0, 0, 0, 1 }, 0.5f, Blend_Mode::Normal);
    REQUIRE(int(gil::get_color(px, gil::red_t())) == Approx(128).margin(1));
    REQUIRE(gil::get_color(px, gil::alpha_t()) == 255);
}

TEST_CASE("Separable blend modes over an opaque backdrop") {
    Pixel white(255, 255, 255, 255);
    Pixel black(0, 0, 0, 255);
    Pixel blue(0, 0, 255, 255);
    Pixel gray(128, 128, 128, 255);

    SECTION("multiply") {
        REQUIRE(composite(white, { 1, 0, 0, 1 }, 1, Blend_Mode::Multiply) == Pixel(255, 0, 0, 255));
        REQUIRE(composite(gray, { 0.5f, 0.5f, 0.5f, 1 }, 1, Blend_Mode::Multiply) == Pixel(64, 64, 64, 255));
    }

    SECTION("screen") {
        REQUIRE(composite(blue, { 1, 0, 0, 1 }, 1, Blend_Mode::Screen) == Pixel(255, 0, 255, 255));
        REQUIRE(composite(black, { 0, 1, 0, 1 }, 1, Blend_Mode::Screen) == Pixel(0, 255, 0, 255));
    }

    SECTION("overlay") {
        // Dark backdrop multiplies, bright backdrop screens
        REQUIRE(composite(black, { 1, 1, 1, 1 }, 1, Blend_Mode::Overlay) == black);
        REQUIRE(composite(white, { 0, 0, 0, 1 }, 1, Blend_Mode::Overlay) == white);
    }

    SECTION("hard-light") {
        REQUIRE(composite(black, { 1, 1, 1, 1 }, 1, Blend_Mode::Hard_Light) == white);
        REQUIRE(composite(white, { 0, 0, 0, 1 }, 1, Blend_Mode::Hard_Light) == black);
    }

    SECTION("soft-light") {
        REQUIRE(composite(black, { 1, 1, 1, 1 }, 1, Blend_Mode::Soft_Light) == black);
        REQUIRE(composite(white, { 0, 0, 0, 1 }, 1, Blend_Mode::Soft_Light) == white);
        auto px = composite(gray, { 1, 1, 1, 1 }, 1, Blend_Mode::Soft_Light);
        REQUIRE(gil::get_color(px, gil::red_t()) > 128);
    }

    SECTION("color-dodge") {
        REQUIRE(composite(black, { 1, 1, 1, 1 }, 1, Blend_Mode::Color_Dodge) == black);
        REQUIRE(composite(gray, { 1, 1, 1, 1 }, 1, Blend_Mode::Color_Dodge) == white);
        REQUIRE(composite(gray, { 0, 0, 0, 1 }, 1, Blend_Mode::Color_Dodge) == gray);
    }

    SECTION("color-burn") {
        REQUIRE(composite(white, { 0, 0, 0, 1 }, 1, Blend_Mode::Color_Burn) == white);
        REQUIRE(composite(gray, { 0, 0, 0, 1 }, 1, Blend_Mode::Color_Burn) == black);
        REQUIRE(composite(gray, { 1, 1, 1, 1 }, 1, Blend_Mode::Color_Burn) == gray);
    }
}
