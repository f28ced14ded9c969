// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: per-object paint buffer and its lifecycle
//

#include "stdafx.h"
#include <texpaint/paint_texture.h>
#include <texpaint/scene.h>
#include "image_io.h"

#include <chrono>
#include <boost/asio/post.hpp>
#include <boost/gil/extension/numeric/sampler.hpp>
#include <boost/gil/extension/numeric/resample.hpp>

namespace gil = boost::gil;

namespace texpaint {

Paint_Texture::Paint_Texture(
    std::shared_ptr<Texture> &&texture,
    std::shared_ptr<Texture> const &original_map,
    Color const &original_color)
    : _texture(std::move(texture)),
    _original_map(original_map),
    _original_color(original_color) {
}

static bool is_paintable(Scene_Object const *target) {
    return target != nullptr && target->material != nullptr && target->mesh != nullptr;
}

static Paint_Texture *paint_of(Scene_Object const *target) {
    if (!is_paintable(target)) {
        return nullptr;
    }

    return target->material->paint.get();
}

Paint_Texture_Manager::Paint_Texture_Manager(Config const &config, ILogger *logger)
    : _config(config), _logger(logger), _decode_pool(config.decode_threads) {
}

Paint_Texture_Manager::~Paint_Texture_Manager() {
    // Decode jobs hold no reference to us, but don't leave them running
    _decode_pool.join();
}

Paint_Texture *Paint_Texture_Manager::ensure(Scene_Object *target) {
    ZoneScoped;
    if (!is_paintable(target)) {
        return nullptr;
    }

    auto &material = *target->material;
    if (material.paint != nullptr) {
        return material.paint.get();
    }

    std::shared_ptr<Texture> texture;
    try {
        texture = std::make_shared<Texture>(_config.buffer_width, _config.buffer_height);
    } catch (std::bad_alloc const &) {
        _logger->log(
            Severity::Error, "couldn't allocate a %ux%u paint buffer for object %zd",
            _config.buffer_width, _config.buffer_height, target->id);
        throw Exception(Status::Out_Of_Memory);
    }

    auto paint = std::make_unique<Paint_Texture>(std::move(texture), material.map, material.color);

    auto base = material.map;
    if (base != nullptr) {
        if (base->has_pixels()) {
            draw_base_layer(paint.get(), base->const_view());
        } else if (!base->encoded().empty()) {
            auto promise = std::make_shared<std::promise<std::optional<Image>>>();
            paint->_pending_base = promise->get_future();
            _logger->log(Severity::Debug, "decoding base image of object %zd (%zu bytes)", target->id, base->encoded().size());

            // The job keeps the encoded data alive, even if the material is
            // cleared in the meantime
            boost::asio::post(_decode_pool, [promise, base]() {
                try {
                    promise->set_value(decode_image(base->encoded()));
                } catch (std::exception const &) {
                    promise->set_exception(std::current_exception());
                }
            });
        }
    }

    material.map = paint->texture();
    material.paint = std::move(paint);
    material.paint->texture()->mark_dirty();

    _logger->log(
        Severity::Debug, "created %ux%u paint texture for object %zd",
        _config.buffer_width, _config.buffer_height, target->id);

    return material.paint.get();
}

Paint_Texture *Paint_Texture_Manager::find(Scene_Object const *target) const {
    return paint_of(target);
}

void Paint_Texture_Manager::wait_for_base_layer(Scene_Object *target) {
    auto paint = paint_of(target);
    if (paint == nullptr || !paint->_pending_base.has_value()) {
        return;
    }

    ZoneScopedN("wait_for_base_layer");
    paint->_pending_base->wait();
    finish_base_layer(paint);
}

bool Paint_Texture_Manager::poll(Scene_Object *target) {
    auto paint = paint_of(target);
    if (paint == nullptr || !paint->_pending_base.has_value()) {
        return false;
    }

    auto status = paint->_pending_base->wait_for(std::chrono::seconds(0));
    if (status != std::future_status::ready) {
        return false;
    }

    finish_base_layer(paint);
    return true;
}

void Paint_Texture_Manager::mark_dirty(Scene_Object *target) {
    auto paint = paint_of(target);
    if (paint == nullptr) {
        return;
    }

    paint->texture()->mark_dirty();
}

void Paint_Texture_Manager::clear(Scene_Object *target) {
    if (!is_paintable(target)) {
        return;
    }

    auto &material = *target->material;
    if (material.paint == nullptr) {
        return;
    }

    material.map = material.paint->original_map();
    material.color = material.paint->original_color();
    // A decode still in flight finishes into a promise nobody waits for
    material.paint.reset();

    _logger->log(Severity::Debug, "cleared paint texture of object %zd", target->id);
}

Status Paint_Texture_Manager::export_png(Scene_Object const *target, char const *path) {
    if (path == nullptr) {
        return Status::Invalid_Arguments;
    }

    auto paint = paint_of(target);
    if (paint == nullptr) {
        return Status::Not_Paintable;
    }

    if (!write_png(path, paint->texture()->const_view())) {
        _logger->log(Severity::Warning, "couldn't write paint texture to '%s'", path);
        return Status::IO_Error;
    }

    _logger->log(Severity::Info, "paint texture written to '%s'", path);
    return Status::OK;
}

void Paint_Texture_Manager::finish_base_layer(Paint_Texture *paint) {
    auto pending = std::move(*paint->_pending_base);
    paint->_pending_base.reset();

    std::optional<Image> image;
    try {
        image = pending.get();
    } catch (std::exception const &ex) {
        _logger->log(Severity::Warning, "base image decode failed: %s", ex.what());
        return;
    }

    if (!image.has_value()) {
        _logger->log(Severity::Warning, "couldn't decode base image, painting on a transparent buffer");
        return;
    }

    draw_base_layer(paint, gil::const_view(*image));
    paint->texture()->mark_dirty();
}

void Paint_Texture_Manager::draw_base_layer(Paint_Texture *paint, Const_Pixel_View const &base) {
    ZoneScoped;
    if (base.width() <= 0 || base.height() <= 0) {
        return;
    }

    auto dst = paint->buffer();
    if (base.dimensions() == dst.dimensions()) {
        gil::copy_pixels(base, dst);
    } else {
        gil::resize_view(base, dst, gil::bilinear_sampler());
    }
}

}
