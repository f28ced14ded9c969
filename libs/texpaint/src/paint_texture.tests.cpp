// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: paint texture manager tests
//

#include "stdafx.h"
#include <catch2/catch.hpp>
#include <texpaint/paint_texture.h>
#include "test_scene.h"

#include <chrono>
#include <filesystem>
#include <thread>

#include <stb_image.h>

using namespace texpaint;
using namespace texpaint::test;

namespace gil = boost::gil;

static std::shared_ptr<Texture> make_solid_texture(unsigned width, unsigned height, Pixel const &color) {
    auto ret = std::make_shared<Texture>(width, height);
    gil::fill_pixels(ret->view(), color);
    return ret;
}

TEST_CASE("Objects without material or geometry aren't paintable") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(64, 64), log.logger.get());

    auto object = make_quad_object(1);

    SECTION("no material") {
        object.material.reset();
        REQUIRE(textures.ensure(&object) == nullptr);
        REQUIRE(textures.find(&object) == nullptr);
        textures.mark_dirty(&object);
        textures.clear(&object);
        textures.wait_for_base_layer(&object);
        REQUIRE(!textures.poll(&object));
        REQUIRE(textures.export_png(&object, "unused.png") == Status::Not_Paintable);
    }

    SECTION("no geometry") {
        object.mesh.reset();
        REQUIRE(textures.ensure(&object) == nullptr);
        REQUIRE(object.material->paint == nullptr);
        REQUIRE(object.material->map == nullptr);
    }

    SECTION("null") {
        REQUIRE(textures.ensure(nullptr) == nullptr);
        textures.clear(nullptr);
        textures.mark_dirty(nullptr);
    }
}

TEST_CASE("Paint buffer allocation failure") {
    Log_Capture log;
    // Far beyond any address space
    Paint_Texture_Manager textures(make_test_config(1u << 30, 1u << 30), log.logger.get());
    auto object = make_quad_object(1);
    auto original_map = make_solid_texture(4, 4, Pixel(0, 255, 0, 255));
    object.material->map = original_map;

    bool thrown = false;
    try {
        textures.ensure(&object);
    } catch (Exception const &ex) {
        thrown = true;
        REQUIRE(ex.code() == Status::Out_Of_Memory);
    }

    REQUIRE(thrown);
    // The material is left as it was
    REQUIRE(object.material->map == original_map);
    REQUIRE(object.material->paint == nullptr);
    REQUIRE(textures.find(&object) == nullptr);
    REQUIRE(log.contains(Severity::Error));
}

TEST_CASE("Paint texture is created lazily and once") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(64, 32), log.logger.get());
    auto object = make_quad_object(1);

    REQUIRE(textures.find(&object) == nullptr);

    auto paint = textures.ensure(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(paint->width() == 64);
    REQUIRE(paint->height() == 32);
    REQUIRE(is_transparent(paint->buffer()));
    REQUIRE(!paint->base_layer_pending());

    // Bound to the material
    REQUIRE(object.material->map == paint->texture());
    REQUIRE(object.material->paint.get() == paint);
    REQUIRE(paint->texture()->needs_update());

    REQUIRE(textures.ensure(&object) == paint);
    REQUIRE(textures.find(&object) == paint);
}

TEST_CASE("Clearing restores the material") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(16, 16), log.logger.get());
    auto object = make_quad_object(1);

    auto original_map = make_solid_texture(4, 4, Pixel(0, 255, 0, 255));
    Color original_color = { 0.25f, 0.5f, 0.75f, 1 };
    object.material->map = original_map;
    object.material->color = original_color;

    auto paint = textures.ensure(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(object.material->map != original_map);
    REQUIRE(paint->original_map() == original_map);
    REQUIRE(paint->original_color() == original_color);

    textures.clear(&object);
    REQUIRE(object.material->map == original_map);
    REQUIRE(object.material->color == original_color);
    REQUIRE(object.material->paint == nullptr);
    REQUIRE(textures.find(&object) == nullptr);

    // A new layer starts from the original map again
    paint = textures.ensure(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(paint->original_map() == original_map);
}

TEST_CASE("Clearing an object that was never painted") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(16, 16), log.logger.get());
    auto object = make_quad_object(1);
    auto original_map = make_solid_texture(4, 4, Pixel(0, 255, 0, 255));
    object.material->map = original_map;

    REQUIRE_NOTHROW(textures.clear(&object));
    REQUIRE(object.material->map == original_map);
    REQUIRE(object.material->paint == nullptr);
}

TEST_CASE("Dirty marks are idempotent") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(16, 16), log.logger.get());
    auto object = make_quad_object(1);
    auto paint = textures.ensure(&object);

    paint->texture()->clear_needs_update();
    REQUIRE(!paint->texture()->needs_update());

    textures.mark_dirty(&object);
    textures.mark_dirty(&object);
    REQUIRE(paint->texture()->needs_update());

    paint->texture()->clear_needs_update();
    REQUIRE(!paint->texture()->needs_update());
}

TEST_CASE("Decoded base texture becomes the bottom layer") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(16, 16), log.logger.get());
    auto object = make_quad_object(1);

    SECTION("same size") {
        auto base = std::make_shared<Texture>(16, 16);
        gil::fill_pixels(base->view(), Pixel(0, 255, 0, 255));
        base->view()(3, 5) = Pixel(255, 0, 0, 255);
        object.material->map = base;

        auto paint = textures.ensure(&object);
        REQUIRE(paint != nullptr);
        REQUIRE(!paint->base_layer_pending());
        REQUIRE(gil::equal_pixels(base->const_view(), gil::const_view(paint->buffer())));
    }

    SECTION("resampled to the buffer resolution") {
        object.material->map = make_solid_texture(4, 4, Pixel(0, 255, 0, 255));

        auto paint = textures.ensure(&object);
        REQUIRE(paint != nullptr);
        auto buf = paint->buffer();
        for (int y = 0; y < 16; y++) {
            for (int x = 0; x < 16; x++) {
                REQUIRE(green_at(buf, x, y) == Approx(255).margin(1));
                REQUIRE(alpha_at(buf, x, y) == Approx(255).margin(1));
                REQUIRE(red_at(buf, x, y) <= 1);
            }
        }
    }
}

TEST_CASE("Encoded base texture is decoded in the background") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(32, 32), log.logger.get());
    auto object = make_quad_object(1);

    auto png = encode_solid_png(32, 32, Pixel(0, 0, 255, 255));
    auto base = Texture::from_encoded(std::move(png));
    REQUIRE(!base->has_pixels());
    object.material->map = base;

    auto paint = textures.ensure(&object);
    REQUIRE(paint != nullptr);
    REQUIRE(paint->base_layer_pending());
    // The binding happens right away
    REQUIRE(object.material->map == paint->texture());
    REQUIRE(paint->original_map() == base);

    SECTION("waiting") {
        textures.wait_for_base_layer(&object);
        REQUIRE(!paint->base_layer_pending());
        REQUIRE(blue_at(paint->buffer(), 0, 0) == 255);
        REQUIRE(blue_at(paint->buffer(), 31, 31) == 255);
        REQUIRE(alpha_at(paint->buffer(), 16, 16) == 255);

        // Nothing left to finish
        REQUIRE(!textures.poll(&object));
    }

    SECTION("polling") {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        bool finished = false;
        while (!finished && std::chrono::steady_clock::now() < deadline) {
            finished = textures.poll(&object);
            if (!finished) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        REQUIRE(finished);
        REQUIRE(!paint->base_layer_pending());
        REQUIRE(blue_at(paint->buffer(), 16, 16) == 255);
    }
}

TEST_CASE("Undecodable base texture leaves the buffer transparent") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(16, 16), log.logger.get());
    auto object = make_quad_object(1);

    std::vector<uint8_t> garbage = { 'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e' };
    object.material->map = Texture::from_encoded(std::move(garbage));

    auto paint = textures.ensure(&object);
    REQUIRE(paint != nullptr);

    REQUIRE_NOTHROW(textures.wait_for_base_layer(&object));
    REQUIRE(!paint->base_layer_pending());
    REQUIRE(is_transparent(paint->buffer()));
    REQUIRE(log.contains(Severity::Warning));
}

TEST_CASE("Clearing while the base texture is being decoded") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(16, 16), log.logger.get());
    auto object = make_quad_object(1);

    auto base = Texture::from_encoded(encode_solid_png(64, 64, Pixel(0, 0, 255, 255)));
    object.material->map = base;

    REQUIRE(textures.ensure(&object) != nullptr);
    textures.clear(&object);
    REQUIRE(object.material->map == base);
    REQUIRE(object.material->paint == nullptr);
}

TEST_CASE("Exporting the paint buffer") {
    Log_Capture log;
    Paint_Texture_Manager textures(make_test_config(8, 4), log.logger.get());
    auto object = make_quad_object(1);

    auto path = (std::filesystem::temp_directory_path() / "texpaint_export_test.png").string();

    SECTION("without a paint layer") {
        REQUIRE(textures.export_png(&object, path.c_str()) == Status::Not_Paintable);
    }

    SECTION("null path") {
        textures.ensure(&object);
        REQUIRE(textures.export_png(&object, nullptr) == Status::Invalid_Arguments);
    }

    SECTION("unwritable path") {
        textures.ensure(&object);
        auto bad = (std::filesystem::temp_directory_path() / "texpaint_no_such_dir" / "x" / "out.png").string();
        REQUIRE(textures.export_png(&object, bad.c_str()) == Status::IO_Error);
        REQUIRE(log.contains(Severity::Warning));
    }

    SECTION("written") {
        auto paint = textures.ensure(&object);
        paint->buffer()(2, 1) = Pixel(255, 0, 0, 255);
        REQUIRE(textures.export_png(&object, path.c_str()) == Status::OK);

        int width, height, channels;
        auto data = stbi_load(path.c_str(), &width, &height, &channels, 4);
        REQUIRE(data != nullptr);
        REQUIRE(width == 8);
        REQUIRE(height == 4);
        auto idx = (1 * 8 + 2) * 4;
        REQUIRE(data[idx + 0] == 255);
        REQUIRE(data[idx + 3] == 255);
        REQUIRE(data[3] == 0);
        stbi_image_free(data);

        std::filesystem::remove(path);
    }
}
