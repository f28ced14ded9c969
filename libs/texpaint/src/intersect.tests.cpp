// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: intersection subroutine tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include "intersect.h"

using namespace texpaint;

// Counter-clockwise when looking from +Z
static glm::vec3 const v0(-1, -1, 0);
static glm::vec3 const v1( 1, -1, 0);
static glm::vec3 const v2( 0,  1, 0);

TEST_CASE("Ray hits the front face of a triangle") {
    glm::vec3 xp;
    glm::vec2 bary;
    float t;

    auto hit = intersect::ray_triangle(xp, t, bary, { 0, 0, 5 }, { 0, 0, -1 }, v0, v1, v2, true);
    REQUIRE(hit);
    REQUIRE(t == Approx(5));
    REQUIRE(xp.x == Approx(0).margin(1e-6));
    REQUIRE(xp.y == Approx(0).margin(1e-6));
    REQUIRE(xp.z == Approx(0).margin(1e-6));

    // The barycentric coordinates reproduce the hit point
    auto p = (1 - bary.x - bary.y) * v0 + bary.x * v1 + bary.y * v2;
    REQUIRE(p.x == Approx(xp.x).margin(1e-6));
    REQUIRE(p.y == Approx(xp.y).margin(1e-6));
}

TEST_CASE("Barycentric coordinates at the vertices") {
    glm::vec3 xp;
    glm::vec2 bary;
    float t;

    // Slightly inside the triangle near v1
    REQUIRE(intersect::ray_triangle(xp, t, bary, { 0.9f, -0.95f, 1 }, { 0, 0, -1 }, v0, v1, v2, true));
    REQUIRE(bary.x > 0.9f);
    REQUIRE(bary.y < 0.05f);

    // Near v2
    REQUIRE(intersect::ray_triangle(xp, t, bary, { 0, 0.9f, 1 }, { 0, 0, -1 }, v0, v1, v2, true));
    REQUIRE(bary.y > 0.9f);
}

TEST_CASE("Ray misses a triangle") {
    glm::vec3 xp;
    glm::vec2 bary;
    float t;

    REQUIRE(!intersect::ray_triangle(xp, t, bary, { 5, 5, 5 }, { 0, 0, -1 }, v0, v1, v2, true));
    // Pointing away
    REQUIRE(!intersect::ray_triangle(xp, t, bary, { 0, 0, 5 }, { 0, 0, 1 }, v0, v1, v2, false));
    // Parallel
    REQUIRE(!intersect::ray_triangle(xp, t, bary, { 0, 0, 5 }, { 1, 0, 0 }, v0, v1, v2, false));
}

TEST_CASE("Back faces are culled on request") {
    glm::vec3 xp;
    glm::vec2 bary;
    float t;

    glm::vec3 origin(0, 0, -5);
    glm::vec3 dir(0, 0, 1);
    REQUIRE(!intersect::ray_triangle(xp, t, bary, origin, dir, v0, v1, v2, true));
    REQUIRE(intersect::ray_triangle(xp, t, bary, origin, dir, v0, v1, v2, false));
    REQUIRE(t == Approx(5));
}

TEST_CASE("Ray-AABB") {
    glm::vec3 min(-1, -1, -1);
    glm::vec3 max(1, 1, 1);

    SECTION("hit") {
        glm::vec3 dir(0.1f, 0.2f, -1);
        REQUIRE(intersect::ray_aabb({ 0, 0, 5 }, 1.0f / dir, min, max));
    }

    SECTION("miss") {
        glm::vec3 dir(0.1f, 0.2f, -1);
        REQUIRE(!intersect::ray_aabb({ 10, 0, 5 }, 1.0f / dir, min, max));
    }

    SECTION("box behind the ray") {
        glm::vec3 dir(0.1f, 0.2f, 1);
        REQUIRE(!intersect::ray_aabb({ 0, 0, 5 }, 1.0f / dir, min, max));
    }

    SECTION("origin inside the box") {
        glm::vec3 dir(1, 1, 1);
        REQUIRE(intersect::ray_aabb({ 0, 0, 0 }, 1.0f / dir, min, max));
    }

    SECTION("flat box") {
        glm::vec3 dir(0.1f, 0.2f, -1);
        REQUIRE(intersect::ray_aabb({ 0, 0, 5 }, 1.0f / dir, { -1, -1, 0 }, { 1, 1, 0 }));
    }
}
