// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: paint engine tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/texpaint.h>
#include "test_scene.h"

#include <filesystem>

using namespace texpaint;
using namespace texpaint::test;

static Pointer_Event make_event(Pointer_Event_Type type, float x, float y) {
    Pointer_Event ret;
    ret.type = type;
    ret.position = { x, y };
    return ret;
}

TEST_CASE("Configuration validation") {
    Config config;
    REQUIRE(validate(config) == Status::OK);

    SECTION("zero width") {
        config.buffer_width = 0;
        REQUIRE(validate(config) == Status::Invalid_Configuration);
    }

    SECTION("oversized buffer") {
        config.buffer_height = max_buffer_dimension + 1;
        REQUIRE(validate(config) == Status::Invalid_Configuration);
    }

    SECTION("largest buffer") {
        config.buffer_width = max_buffer_dimension;
        REQUIRE(validate(config) == Status::OK);
    }

    SECTION("zero stipple density") {
        config.stipple_density = 0;
        REQUIRE(validate(config) == Status::Invalid_Configuration);
    }

    SECTION("cursor opacity") {
        config.cursor_disabled_opacity = 1.5f;
        REQUIRE(validate(config) == Status::Invalid_Configuration);
        config.cursor_disabled_opacity = NAN;
        REQUIRE(validate(config) == Status::Invalid_Configuration);
    }

    SECTION("no decoder threads") {
        config.decode_threads = 0;
        REQUIRE(validate(config) == Status::Invalid_Configuration);
    }
}

TEST_CASE("Engine creation") {
    Test_Scene scene;

    SECTION("invalid configuration") {
        Config config;
        config.buffer_width = 0;
        try {
            make_paint_engine(config, &scene);
            FAIL("no exception was thrown");
        } catch (Exception const &ex) {
            REQUIRE(ex.code() == Status::Invalid_Configuration);
            REQUIRE(std::string(ex.what()) == to_string(Status::Invalid_Configuration));
        }
    }

    SECTION("no scene") {
        REQUIRE_THROWS_AS(make_paint_engine(Config(), nullptr), Exception);
    }

    SECTION("default logger") {
        auto engine = make_paint_engine(make_test_config(), &scene);
        REQUIRE(engine != nullptr);
        REQUIRE(engine->state() == Session_State::Idle);
    }
}

TEST_CASE("Painting through the engine") {
    Log_Capture log;
    Test_Scene scene;
    auto object = make_quad_object(3);
    scene.selected = &object;

    auto engine = make_paint_engine(make_test_config(), &scene, log.logger.get());
    REQUIRE(engine->paint_texture(&object) == nullptr);

    engine->handle(make_event(Pointer_Event_Type::Down, 512, 512));
    REQUIRE(engine->state() == Session_State::Dragging);
    engine->handle(make_event(Pointer_Event_Type::Move, 560, 512));
    engine->handle(make_event(Pointer_Event_Type::Up, 560, 512));
    REQUIRE(engine->state() == Session_State::Idle);
    REQUIRE(engine->cursor().center == glm::vec2(560, 512));

    auto paint = engine->paint_texture(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(alpha_at(paint->buffer(), 540, 512) == 255);
    REQUIRE(!engine->poll());

    // Stroke begin and end are logged
    REQUIRE(log.contains(Severity::Debug));

    auto path = (std::filesystem::temp_directory_path() / "texpaint_engine_test.png").string();
    REQUIRE(engine->export_paint(&object, path.c_str()) == Status::OK);
    REQUIRE(std::filesystem::exists(path));
    std::filesystem::remove(path);

    engine->clear_paint(&object);
    REQUIRE(engine->paint_texture(&object) == nullptr);
    REQUIRE(object.material->map == nullptr);
    REQUIRE(engine->export_paint(&object, path.c_str()) == Status::Not_Paintable);
}

TEST_CASE("Flat canvas engine") {
    Log_Capture log;
    Test_Scene scene;
    auto object = make_quad_object(3);
    scene.selected = &object;
    scene.view_state.viewport = { 0, 0, 256, 256 };

    auto config = make_test_config(256, 256);
    config.projection = Projection_Mode::Flat_Canvas;
    auto engine = make_paint_engine(config, &scene, log.logger.get());

    engine->handle(make_event(Pointer_Event_Type::Down, 100, 50));
    engine->handle(make_event(Pointer_Event_Type::Leave, 100, 50));
    REQUIRE(engine->state() == Session_State::Idle);

    auto paint = engine->paint_texture(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(alpha_at(paint->buffer(), 100, 50) == 255);
    REQUIRE(alpha_at(paint->buffer(), 50, 100) == 0);
}

TEST_CASE("Log messages are filtered by severity") {
    Log_Capture log(Severity::Warning);

    log.logger->log(Severity::Debug, "dropped %d", 1);
    log.logger->log(Severity::Info, "dropped %s", "too");
    log.logger->log(Severity::Error, "kept %d/%s", 2, "x");

    REQUIRE(log.messages.size() == 1);
    REQUIRE(log.messages[0].first == Severity::Error);
    REQUIRE(log.messages[0].second == "kept 2/x");
}

TEST_CASE("Status and severity names") {
    REQUIRE(std::string(to_string(Status::OK)) == "OK");
    REQUIRE(std::string(to_string(Status::Out_Of_Memory)) == "out of memory");
    REQUIRE(std::string(to_string(Severity::Warning)) == "warning");
}
