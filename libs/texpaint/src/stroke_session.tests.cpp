// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: stroke session tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/stroke_session.h>
#include "test_scene.h"

using namespace texpaint;
using namespace texpaint::test;

struct Session_Fixture {
    Session_Fixture()
        : config(make_test_config()),
        object(make_quad_object(7)),
        textures(config, log.logger.get()),
        projector(make_surface_projector()),
        session(config, &scene, projector.get(), &textures, log.logger.get()) {
        scene.selected = &object;
    }

    Pixel_View buffer() {
        auto paint = textures.find(&object);
        REQUIRE(paint != nullptr);
        return paint->buffer();
    }

    Log_Capture log;
    Config config;
    Test_Scene scene;
    Scene_Object object;
    Paint_Texture_Manager textures;
    std::unique_ptr<IProjector> projector;
    Stroke_Session session;
};

TEST_CASE_METHOD(Session_Fixture, "A click leaves a dab") {
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(session.state() == Session_State::Dragging);

    auto stroke = session.stroke();
    REQUIRE(stroke != nullptr);
    REQUIRE(stroke->target == object.id);
    REQUIRE(stroke->samples.size() == 1);

    // The paint texture was created and bound
    auto paint = textures.find(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(object.material->map == paint->texture());
    REQUIRE(paint->texture()->needs_update());

    auto buf = buffer();
    REQUIRE(alpha_at(buf, 512, 512) == 255);
    REQUIRE(red_at(buf, 512, 512) == 255);
    REQUIRE(alpha_at(buf, 512 + 20, 512) == 0);

    session.pointer_up({ 512, 512 });
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(session.stroke() == nullptr);

    // Pixels are permanent
    REQUIRE(alpha_at(buf, 512, 512) == 255);
}

TEST_CASE_METHOD(Session_Fixture, "Dragging draws connected segments") {
    REQUIRE(session.pointer_down({ 300, 500 }, Pointer_Button::Primary));
    REQUIRE(session.pointer_move({ 320, 500 }));
    REQUIRE(session.pointer_move({ 340, 500 }));
    REQUIRE(session.stroke()->samples.size() == 3);

    auto buf = buffer();
    for (int x = 300; x <= 340; x++) {
        REQUIRE(alpha_at(buf, x, 500) == 255);
    }

    session.pointer_up({ 340, 500 });
    REQUIRE(session.state() == Session_State::Idle);
}

TEST_CASE_METHOD(Session_Fixture, "Per-sample brushes only stamp the samples") {
    scene.settings.type = Brush_Type::Square;
    scene.settings.size = 10;

    REQUIRE(session.pointer_down({ 300, 500 }, Pointer_Button::Primary));
    REQUIRE(session.pointer_move({ 400, 500 }));

    auto buf = buffer();
    REQUIRE(alpha_at(buf, 300, 500) == 255);
    REQUIRE(alpha_at(buf, 400, 500) == 255);
    REQUIRE(alpha_at(buf, 350, 500) == 0);
}

TEST_CASE_METHOD(Session_Fixture, "Gradient click starts a stroke without drawing") {
    scene.settings.type = Brush_Type::Gradient;

    REQUIRE(session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(session.state() == Session_State::Dragging);
    REQUIRE(is_transparent(buffer()));

    REQUIRE(session.pointer_move({ 540, 512 }));
    REQUIRE(alpha_at(buffer(), 525, 512) == 255);
}

TEST_CASE_METHOD(Session_Fixture, "Closed gate rejects everything") {
    SECTION("paint mode off") {
        scene.painting = false;
    }

    SECTION("nothing selected") {
        scene.selected = nullptr;
    }

    SECTION("locked") {
        scene.locked.insert(object.id);
    }

    REQUIRE(session.paintable_target() == nullptr);
    REQUIRE(!session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(!session.pointer_move({ 520, 512 }));
    session.pointer_up({ 520, 512 });
    session.pointer_leave();

    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(object.material->paint == nullptr);
    REQUIRE(object.material->map == nullptr);

    // The cursor shows that painting isn't possible
    REQUIRE(!session.cursor().enabled);
    REQUIRE(session.cursor().opacity == Approx(config.cursor_disabled_opacity));
}

TEST_CASE_METHOD(Session_Fixture, "Non-primary buttons are ignored") {
    REQUIRE(!session.pointer_down({ 512, 512 }, Pointer_Button::Secondary));
    REQUIRE(!session.pointer_down({ 512, 512 }, Pointer_Button::Middle));
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(object.material->paint == nullptr);
}

TEST_CASE_METHOD(Session_Fixture, "Pointer down that misses the object") {
    object.transform = glm::scale(glm::mat4(1.0f), glm::vec3(0.5f));

    REQUIRE(!session.pointer_down({ 50, 50 }, Pointer_Button::Primary));
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(object.material->paint == nullptr);
}

TEST_CASE_METHOD(Session_Fixture, "Object without texture coordinates") {
    object.mesh = make_quad_mesh(false);

    REQUIRE(!session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(object.material->paint == nullptr);
}

TEST_CASE_METHOD(Session_Fixture, "Object without material") {
    object.material.reset();

    REQUIRE(!session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(session.state() == Session_State::Idle);
}

TEST_CASE_METHOD(Session_Fixture, "Misses during a drag are skipped") {
    object.transform = glm::scale(glm::mat4(1.0f), glm::vec3(0.5f));

    REQUIRE(session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(!session.pointer_move({ 50, 50 }));
    REQUIRE(session.state() == Session_State::Dragging);
    REQUIRE(session.stroke()->samples.size() == 1);

    REQUIRE(session.pointer_move({ 520, 512 }));
    REQUIRE(session.stroke()->samples.size() == 2);
}

TEST_CASE_METHOD(Session_Fixture, "Locking mid-drag halts the stroke") {
    REQUIRE(session.pointer_down({ 300, 300 }, Pointer_Button::Primary));
    scene.locked.insert(object.id);

    REQUIRE(!session.pointer_move({ 600, 600 }));
    REQUIRE(session.state() == Session_State::Idle);

    auto buf = buffer();
    // The dab stays, nothing is drawn past the lock
    REQUIRE(alpha_at(buf, 300, 300) == 255);
    REQUIRE(alpha_at(buf, 600, 600) == 0);
    REQUIRE(alpha_at(buf, 450, 450) == 0);

    // Unlocking doesn't resume the stroke
    scene.locked.clear();
    REQUIRE(!session.pointer_move({ 700, 700 }));
    REQUIRE(alpha_at(buf, 700, 700) == 0);
}

TEST_CASE_METHOD(Session_Fixture, "Selection change mid-drag halts the stroke") {
    auto other = make_quad_object(8);

    REQUIRE(session.pointer_down({ 300, 300 }, Pointer_Button::Primary));
    scene.selected = &other;

    REQUIRE(!session.pointer_move({ 600, 600 }));
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(other.material->paint == nullptr);
}

TEST_CASE_METHOD(Session_Fixture, "Leaving the canvas ends the stroke") {
    REQUIRE(session.pointer_down({ 300, 300 }, Pointer_Button::Primary));
    session.pointer_leave();
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(alpha_at(buffer(), 300, 300) == 255);
}

TEST_CASE_METHOD(Session_Fixture, "Settings are snapshotted at stroke start") {
    scene.settings.primary_color = { 1, 0, 0, 1 };
    REQUIRE(session.pointer_down({ 300, 500 }, Pointer_Button::Primary));

    scene.settings.primary_color = { 0, 0, 1, 1 };
    scene.settings.size = 100;
    REQUIRE(session.pointer_move({ 340, 500 }));

    auto buf = buffer();
    REQUIRE(red_at(buf, 330, 500) == 255);
    REQUIRE(blue_at(buf, 330, 500) == 0);
    // Still the old size
    REQUIRE(alpha_at(buf, 320, 500 + 30) == 0);

    // The next stroke picks up the change
    session.pointer_up({ 340, 500 });
    REQUIRE(session.pointer_down({ 700, 700 }, Pointer_Button::Primary));
    REQUIRE(blue_at(buf, 700, 700) == 255);
    REQUIRE(session.stroke()->settings.size == 100);
}

TEST_CASE_METHOD(Session_Fixture, "Settings are sanitized") {
    scene.settings.size = 1000;
    scene.settings.opacity = 7;

    REQUIRE(session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    REQUIRE(session.stroke()->settings.size == max_brush_size);
    REQUIRE(session.stroke()->settings.opacity == 1);
}

TEST_CASE_METHOD(Session_Fixture, "Cursor follows the pointer and the live settings") {
    session.pointer_move({ 100, 200 });
    REQUIRE(session.cursor().enabled);
    REQUIRE(session.cursor().opacity == 1);
    REQUIRE(session.cursor().center == glm::vec2(100, 200));
    REQUIRE(session.cursor().size == scene.settings.size);
    REQUIRE(session.cursor().shape == Cursor_Shape::Circle);

    scene.settings.type = Brush_Type::Square;
    scene.settings.size = 42;
    session.pointer_move({ 110, 210 });
    REQUIRE(session.cursor().shape == Cursor_Shape::Square);
    REQUIRE(session.cursor().size == 42);

    scene.painting = false;
    session.pointer_leave();
    REQUIRE(!session.cursor().enabled);
    REQUIRE(session.cursor().center == glm::vec2(110, 210));
}

TEST_CASE_METHOD(Session_Fixture, "Event dispatch") {
    Pointer_Event ev;
    ev.type = Pointer_Event_Type::Down;
    ev.position = { 512, 512 };
    session.handle(ev);
    REQUIRE(session.state() == Session_State::Dragging);

    ev.type = Pointer_Event_Type::Move;
    ev.position = { 530, 512 };
    session.handle(ev);
    REQUIRE(session.stroke()->samples.size() == 2);

    ev.type = Pointer_Event_Type::Up;
    session.handle(ev);
    REQUIRE(session.state() == Session_State::Idle);
}

TEST_CASE_METHOD(Session_Fixture, "Base texture is drawn before the first dab") {
    auto base = std::make_shared<Texture>(1024, 1024);
    boost::gil::fill_pixels(base->view(), Pixel(0, 255, 0, 255));
    object.material->map = base;

    REQUIRE(session.pointer_down({ 512, 512 }, Pointer_Button::Primary));
    auto buf = buffer();
    REQUIRE(red_at(buf, 512, 512) == 255);
    REQUIRE(green_at(buf, 512, 512) == 0);
    REQUIRE(green_at(buf, 100, 100) == 255);

    session.pointer_up({ 512, 512 });
    textures.clear(&object);
    REQUIRE(object.material->map == base);
}

TEST_CASE_METHOD(Session_Fixture, "First dab lands on top of an encoded base texture") {
    auto png = encode_solid_png(64, 64, Pixel(0, 255, 0, 255));
    REQUIRE(!png.empty());
    object.material->map = Texture::from_encoded(std::move(png));

    REQUIRE(session.pointer_down({ 512, 512 }, Pointer_Button::Primary));

    auto paint = textures.find(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(!paint->base_layer_pending());

    auto buf = buffer();
    // The dab
    REQUIRE(red_at(buf, 512, 512) == 255);
    REQUIRE(green_at(buf, 512, 512) == 0);
    // The base layer around it
    REQUIRE(green_at(buf, 100, 100) >= 254);
    REQUIRE(green_at(buf, 900, 900) >= 254);
    REQUIRE(alpha_at(buf, 100, 100) >= 254);
}

TEST_CASE_METHOD(Session_Fixture, "Closed gate leaves existing paint untouched") {
    REQUIRE(session.pointer_down({ 300, 300 }, Pointer_Button::Primary));
    REQUIRE(session.pointer_move({ 340, 320 }));
    session.pointer_up({ 340, 320 });

    auto buf = buffer();
    Image snapshot(buf.dimensions());
    boost::gil::copy_pixels(buf, boost::gil::view(snapshot));

    SECTION("paint mode off") {
        scene.painting = false;
    }

    SECTION("nothing selected") {
        scene.selected = nullptr;
    }

    SECTION("locked") {
        scene.locked.insert(object.id);
    }

    REQUIRE(!session.pointer_down({ 500, 500 }, Pointer_Button::Primary));
    REQUIRE(!session.pointer_move({ 600, 500 }));
    REQUIRE(!session.pointer_move({ 300, 300 }));
    session.pointer_up({ 300, 300 });
    session.pointer_leave();

    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(boost::gil::equal_pixels(boost::gil::const_view(snapshot), buf));
}

TEST_CASE_METHOD(Session_Fixture, "Other buttons don't end the stroke") {
    REQUIRE(session.pointer_down({ 300, 500 }, Pointer_Button::Primary));

    session.pointer_up({ 300, 500 }, Pointer_Button::Secondary);
    session.pointer_up({ 300, 500 }, Pointer_Button::Middle);
    REQUIRE(session.state() == Session_State::Dragging);

    REQUIRE(session.pointer_move({ 340, 500 }));
    REQUIRE(session.stroke()->samples.size() == 2);

    Pointer_Event ev;
    ev.type = Pointer_Event_Type::Up;
    ev.position = { 340, 500 };
    ev.button = Pointer_Button::Secondary;
    session.handle(ev);
    REQUIRE(session.state() == Session_State::Dragging);

    ev.button = Pointer_Button::Primary;
    session.handle(ev);
    REQUIRE(session.state() == Session_State::Idle);
}

TEST_CASE("Out of memory surfaces through the session") {
    Log_Capture log;
    // Far beyond any address space
    auto config = make_test_config(1u << 30, 1u << 30);
    Test_Scene scene;
    auto object = make_quad_object(7);
    scene.selected = &object;
    Paint_Texture_Manager textures(config, log.logger.get());
    auto projector = make_surface_projector();
    Stroke_Session session(config, &scene, projector.get(), &textures, log.logger.get());

    bool thrown = false;
    try {
        session.pointer_down({ 512, 512 }, Pointer_Button::Primary);
    } catch (Exception const &ex) {
        thrown = true;
        REQUIRE(ex.code() == Status::Out_Of_Memory);
    }

    REQUIRE(thrown);
    REQUIRE(session.state() == Session_State::Idle);
    REQUIRE(object.material->paint == nullptr);
    REQUIRE(object.material->map == nullptr);
    REQUIRE(log.contains(Severity::Error));
}
