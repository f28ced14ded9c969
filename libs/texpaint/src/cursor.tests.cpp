// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: cursor indicator tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/cursor.h>

using namespace texpaint;

TEST_CASE("Cursor shape follows the brush type") {
    Brush_Settings settings;

    settings.type = Brush_Type::Round;
    REQUIRE(compute_cursor({ 0, 0 }, settings, true, 0.5f).shape == Cursor_Shape::Circle);

    for (auto type : { Brush_Type::Square, Brush_Type::Airbrush, Brush_Type::Stipple, Brush_Type::Gradient }) {
        settings.type = type;
        REQUIRE(compute_cursor({ 0, 0 }, settings, true, 0.5f).shape == Cursor_Shape::Square);
    }
}

TEST_CASE("Cursor is centered on the pointer and sized like the brush") {
    Brush_Settings settings;
    settings.size = 35;

    auto cursor = compute_cursor({ 120, 80 }, settings, true, 0.5f);
    REQUIRE(cursor.center == glm::vec2(120, 80));
    REQUIRE(cursor.size == 35);
    REQUIRE(cursor.enabled);
    REQUIRE(cursor.opacity == 1);
    REQUIRE(cursor.border_width == 2);
    REQUIRE(cursor.border_color.a == Approx(0.8f));
    REQUIRE(cursor.fill_color.a == Approx(0.1f));

    settings.size = 500;
    REQUIRE(compute_cursor({ 0, 0 }, settings, true, 0.5f).size == max_brush_size);
}

TEST_CASE("Cursor fades while painting isn't possible") {
    Brush_Settings settings;

    auto cursor = compute_cursor({ 0, 0 }, settings, false, 0.5f);
    REQUIRE(!cursor.enabled);
    REQUIRE(cursor.opacity == Approx(0.5f));
    REQUIRE(cursor.border_color.a == Approx(0.4f));
    REQUIRE(cursor.fill_color.a == Approx(0.05f));

    REQUIRE(compute_cursor({ 0, 0 }, settings, false, 0.25f).opacity == Approx(0.25f));
}
