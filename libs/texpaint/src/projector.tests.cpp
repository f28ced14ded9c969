// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: projector tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/projector.h>
#include "test_scene.h"

using namespace texpaint;
using namespace texpaint::test;

TEST_CASE("Pointer to NDC") {
    Viewport viewport = { 100, 50, 200, 100 };

    auto center = pointer_to_ndc({ 200, 100 }, viewport);
    REQUIRE(center.x == Approx(0).margin(1e-6));
    REQUIRE(center.y == Approx(0).margin(1e-6));

    auto top_left = pointer_to_ndc({ 100, 50 }, viewport);
    REQUIRE(top_left.x == Approx(-1));
    REQUIRE(top_left.y == Approx(1));

    auto bottom_right = pointer_to_ndc({ 300, 150 }, viewport);
    REQUIRE(bottom_right.x == Approx(1));
    REQUIRE(bottom_right.y == Approx(-1));
}

TEST_CASE("Pick ray goes through the camera") {
    auto view = make_front_view();
    auto ray = make_pick_ray({ 0.5f, -0.25f }, view.camera);

    REQUIRE(ray.direction.x == Approx(0).margin(1e-5));
    REQUIRE(ray.direction.y == Approx(0).margin(1e-5));
    REQUIRE(ray.direction.z == Approx(-1));
    REQUIRE(ray.origin.x == Approx(0.5f));
    REQUIRE(ray.origin.y == Approx(-0.25f));
    // Starts on the near plane
    REQUIRE(ray.origin.z == Approx(2 - 0.1f));
}

TEST_CASE("Surface projection onto a quad") {
    auto projector = make_surface_projector();
    auto view = make_front_view();
    auto object = make_quad_object(1);

    SECTION("center") {
        auto hit = projector->project({ 512, 512 }, view, object);
        REQUIRE(hit.has_value());
        REQUIRE(hit->uv.has_value());
        REQUIRE(hit->uv->x == Approx(0.5f).margin(1e-4));
        REQUIRE(hit->uv->y == Approx(0.5f).margin(1e-4));
        REQUIRE(hit->point.z == Approx(0).margin(1e-4));
    }

    SECTION("pointer coordinates match pixel coordinates") {
        auto hit = projector->project({ 256, 768 }, view, object);
        REQUIRE(hit.has_value());
        REQUIRE(hit->uv.has_value());
        auto px = uv_to_pixel(*hit->uv, 1024, 1024);
        REQUIRE(px.x == Approx(256).margin(0.01));
        REQUIRE(px.y == Approx(768).margin(0.01));
        REQUIRE(hit->point.x == Approx(-0.5f).margin(1e-4));
        REQUIRE(hit->point.y == Approx(-0.5f).margin(1e-4));
    }
}

TEST_CASE("Surface projection misses") {
    auto projector = make_surface_projector();
    auto view = make_front_view();
    auto object = make_quad_object(1);
    object.transform = glm::scale(glm::mat4(1.0f), glm::vec3(0.5f));

    SECTION("outside the object") {
        REQUIRE(!projector->project({ 50, 50 }, view, object).has_value());
        REQUIRE(!projector->project({ 1000, 512 }, view, object).has_value());
    }

    SECTION("degenerate viewport") {
        view.viewport.width = 0;
        REQUIRE(!projector->project({ 512, 512 }, view, object).has_value());
    }

    SECTION("no geometry") {
        object.mesh.reset();
        REQUIRE(!projector->project({ 512, 512 }, view, object).has_value());
    }

    SECTION("empty mesh") {
        object.mesh = std::make_shared<Mesh>();
        REQUIRE(!projector->project({ 512, 512 }, view, object).has_value());
    }
}

TEST_CASE("Model transform is honored") {
    auto projector = make_surface_projector();
    auto view = make_front_view();
    auto object = make_quad_object(1);
    object.transform = glm::translate(glm::mat4(1.0f), glm::vec3(0.5f, 0, 0));

    // World origin is at x = -0.5 in object space
    auto hit = projector->project({ 512, 512 }, view, object);
    REQUIRE(hit.has_value());
    REQUIRE(hit->uv.has_value());
    REQUIRE(hit->uv->x == Approx(0.25f).margin(1e-4));
    REQUIRE(hit->uv->y == Approx(0.5f).margin(1e-4));

    // Hit point is in world space
    REQUIRE(hit->point.x == Approx(0).margin(1e-4));
    REQUIRE(hit->point.y == Approx(0).margin(1e-4));
}

TEST_CASE("Vertices edited in place are picked up") {
    auto projector = make_surface_projector();
    auto view = make_front_view();

    auto mesh = make_quad_mesh();
    for (auto &p : mesh->position) {
        p *= 0.25f;
    }

    Scene_Object object;
    object.id = 1;
    object.mesh = mesh;
    object.material = std::make_shared<Material>();

    // World x = 0.5 maps to pointer x = 768
    REQUIRE(projector->project({ 512, 512 }, view, object).has_value());
    REQUIRE(!projector->project({ 768, 512 }, view, object).has_value());

    for (auto &p : mesh->position) {
        p.x += 0.5f;
    }

    auto hit = projector->project({ 768, 512 }, view, object);
    REQUIRE(hit.has_value());
    REQUIRE(hit->uv.has_value());
    REQUIRE(hit->uv->x == Approx(0.5f).margin(1e-4));
    REQUIRE(hit->uv->y == Approx(0.5f).margin(1e-4));
    REQUIRE(hit->point.x == Approx(0.5f).margin(1e-4));

    REQUIRE(!projector->project({ 512, 512 }, view, object).has_value());
}

TEST_CASE("Mesh without texture coordinates") {
    auto projector = make_surface_projector();
    auto view = make_front_view();
    auto object = make_quad_object(1, false);

    auto hit = projector->project({ 512, 512 }, view, object);
    REQUIRE(hit.has_value());
    REQUIRE(!hit->uv.has_value());
}

TEST_CASE("Back faces") {
    auto projector = make_surface_projector();
    auto view = make_front_view();
    auto object = make_quad_object(1);
    // Facing away from the camera
    object.transform = glm::rotate(glm::mat4(1.0f), glm::pi<float>(), glm::vec3(0, 1, 0));

    REQUIRE(!projector->project({ 300, 300 }, view, object).has_value());

    object.material->double_sided = true;
    auto hit = projector->project({ 300, 300 }, view, object);
    REQUIRE(hit.has_value());
    REQUIRE(hit->uv.has_value());
}

TEST_CASE("Nearest hit wins") {
    auto projector = make_surface_projector();
    auto view = make_front_view();

    // Two parallel quads, the second one closer to the camera
    auto mesh = std::make_shared<Mesh>();
    mesh->position = {
        { -1, -1, 0 }, { 1, -1, 0 }, { 1, 1, 0 }, { -1, 1, 0 },
        { -1, -1, 0.5f }, { 1, -1, 0.5f }, { 1, 1, 0.5f }, { -1, 1, 0.5f },
    };
    mesh->uv = {
        { 0, 0 }, { 0.5f, 0 }, { 0.5f, 1 }, { 0, 1 },
        { 0.5f, 0 }, { 1, 0 }, { 1, 1 }, { 0.5f, 1 },
    };
    mesh->elements = { 0, 1, 2, 0, 2, 3, 4, 5, 6, 4, 6, 7 };

    Scene_Object object;
    object.id = 1;
    object.mesh = mesh;
    object.material = std::make_shared<Material>();

    auto hit = projector->project({ 300, 300 }, view, object);
    REQUIRE(hit.has_value());
    REQUIRE(hit->triangle >= 2);
    REQUIRE(hit->point.z == Approx(0.5f).margin(1e-4));
    REQUIRE(hit->uv->x > 0.5f);
}

TEST_CASE("Out-of-range indices are skipped") {
    auto projector = make_surface_projector();
    auto view = make_front_view();
    auto mesh = std::make_shared<Mesh>(*make_quad_mesh());
    mesh->elements = { 0, 1, 7, 0, 2, 3 };

    Scene_Object object;
    object.mesh = mesh;
    object.material = std::make_shared<Material>();

    // Upper-left half is still there
    REQUIRE(projector->project({ 100, 100 }, view, object).has_value());
    REQUIRE(!projector->project({ 900, 900 }, view, object).has_value());
}

TEST_CASE("Flat canvas projection") {
    auto projector = make_flat_canvas_projector(1024, 512);
    View_State view;
    view.viewport = { 10, 20, 1024, 512 };
    auto object = make_quad_object(1);

    SECTION("maps pointer to pixel") {
        auto hit = projector->project({ 110, 220 }, view, object);
        REQUIRE(hit.has_value());
        REQUIRE(hit->uv.has_value());
        auto px = uv_to_pixel(*hit->uv, 1024, 512);
        REQUIRE(px.x == Approx(100));
        REQUIRE(px.y == Approx(200));
    }

    SECTION("outside the buffer") {
        REQUIRE(!projector->project({ 5, 100 }, view, object).has_value());
        REQUIRE(!projector->project({ 110, 600 }, view, object).has_value());
        REQUIRE(!projector->project({ 1040, 100 }, view, object).has_value());
    }
}

TEST_CASE("Projector is chosen by the configuration") {
    Config config;
    config.buffer_width = 64;
    config.buffer_height = 64;
    View_State view;
    auto object = make_quad_object(1);

    config.projection = Projection_Mode::Flat_Canvas;
    auto flat = make_projector(config);
    // The flat canvas ignores the camera and the degenerate viewport
    REQUIRE(flat->project({ 10, 10 }, view, object).has_value());

    config.projection = Projection_Mode::Surface;
    auto surface = make_projector(config);
    REQUIRE(!surface->project({ 10, 10 }, view, object).has_value());
}
