// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: brush settings tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/brush.h>

using namespace texpaint;

TEST_CASE("Sanitize clamps out-of-range values") {
    Brush_Settings settings;
    settings.size = 250;
    settings.opacity = -1;
    settings.flow = 2;
    settings.hardness = 1.5f;
    settings.texture_strength = -0.25f;
    settings.primary_color = { 2, -1, 0.5f, 3 };

    auto clean = sanitize(settings);

    REQUIRE(clean.size == max_brush_size);
    REQUIRE(clean.opacity == 0);
    REQUIRE(clean.flow == 1);
    REQUIRE(clean.hardness == 1);
    REQUIRE(clean.texture_strength == 0);
    REQUIRE(clean.primary_color == Color(1, 0, 0.5f, 1));

    settings.size = 0;
    REQUIRE(sanitize(settings).size == min_brush_size);
}

TEST_CASE("Sanitize keeps in-range values") {
    Brush_Settings settings;
    settings.size = 37;
    settings.opacity = 0.25f;
    settings.gradient_angle = 90;

    auto clean = sanitize(settings);
    REQUIRE(clean.size == 37);
    REQUIRE(clean.opacity == 0.25f);
    REQUIRE(clean.gradient_angle == 90);
    REQUIRE(clean.type == settings.type);
    REQUIRE(clean.blend_mode == settings.blend_mode);
}

TEST_CASE("Sanitize maps NaN to the lower bound") {
    Brush_Settings settings;
    settings.size = NAN;
    settings.opacity = NAN;

    auto clean = sanitize(settings);
    REQUIRE(clean.size == min_brush_size);
    REQUIRE(clean.opacity == 0);
}

TEST_CASE("Gradient angle wraps around") {
    Brush_Settings settings;

    settings.gradient_angle = -30;
    REQUIRE(sanitize(settings).gradient_angle == Approx(330));

    settings.gradient_angle = 725;
    REQUIRE(sanitize(settings).gradient_angle == Approx(5));

    settings.gradient_angle = 360;
    REQUIRE(sanitize(settings).gradient_angle == 0);

    settings.gradient_angle = INFINITY;
    REQUIRE(sanitize(settings).gradient_angle == 0);
}

TEST_CASE("Brush size steps are clamped") {
    Brush_Settings settings;
    settings.size = 20;

    REQUIRE(step_brush_size(settings, 5).size == 25);
    REQUIRE(step_brush_size(settings, -5).size == 15);

    settings.size = 98;
    REQUIRE(step_brush_size(settings, 5).size == max_brush_size);

    settings.size = 3;
    REQUIRE(step_brush_size(settings, -5).size == min_brush_size);
}

TEST_CASE("Parsing hex colors") {
    SECTION("#rrggbb") {
        auto c = parse_color("#ff8000");
        REQUIRE(c.has_value());
        REQUIRE(c->r == Approx(1));
        REQUIRE(c->g == Approx(128 / 255.0f));
        REQUIRE(c->b == Approx(0));
        REQUIRE(c->a == Approx(1));
    }

    SECTION("#rgb") {
        auto c = parse_color("#0F0");
        REQUIRE(c.has_value());
        REQUIRE(*c == Color(0, 1, 0, 1));
    }

    SECTION("#rrggbbaa") {
        auto c = parse_color("#00000080");
        REQUIRE(c.has_value());
        REQUIRE(c->a == Approx(128 / 255.0f));
    }

    SECTION("malformed") {
        REQUIRE(!parse_color("").has_value());
        REQUIRE(!parse_color("ff0000").has_value());
        REQUIRE(!parse_color("#ff00").has_value());
        REQUIRE(!parse_color("#gg0000").has_value());
        REQUIRE(!parse_color("#ff00000").has_value());
    }
}

TEST_CASE("Formatting hex colors") {
    REQUIRE(to_hex_string({ 1, 0, 0, 1 }) == "#ff0000");
    REQUIRE(to_hex_string({ 0, 0, 1, 0.5f }) == "#0000ff");
    REQUIRE(to_hex_string({ 2, -1, 0, 1 }) == "#ff0000");

    auto c = parse_color("#3a7bd5");
    REQUIRE(c.has_value());
    REQUIRE(to_hex_string(*c) == "#3a7bd5");
}

TEST_CASE("Brush type identifiers") {
    REQUIRE(brush_type_from_string("round") == Brush_Type::Round);
    REQUIRE(brush_type_from_string("square") == Brush_Type::Square);
    REQUIRE(brush_type_from_string("airbrush") == Brush_Type::Airbrush);
    REQUIRE(brush_type_from_string("stipple") == Brush_Type::Stipple);
    REQUIRE(brush_type_from_string("gradient") == Brush_Type::Gradient);
    REQUIRE(!brush_type_from_string("spray").has_value());

    REQUIRE(std::string(to_string(Brush_Type::Airbrush)) == "airbrush");
}

TEST_CASE("Unknown blend mode identifiers fall back to normal") {
    REQUIRE(blend_mode_from_string("multiply") == Blend_Mode::Multiply);
    REQUIRE(blend_mode_from_string("color-burn") == Blend_Mode::Color_Burn);
    REQUIRE(blend_mode_from_string("source-over") == Blend_Mode::Normal);
    REQUIRE(blend_mode_from_string("difference") == Blend_Mode::Normal);
    REQUIRE(blend_mode_from_string("") == Blend_Mode::Normal);

    REQUIRE(std::string(to_string(Blend_Mode::Soft_Light)) == "soft-light");
    REQUIRE(blend_mode_from_string(to_string(Blend_Mode::Hard_Light)) == Blend_Mode::Hard_Light);
}
