// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: per-object paint buffer and its lifecycle
//

#pragma once

#include <future>
#include <memory>
#include <optional>

#include <boost/asio/thread_pool.hpp>

#include <texpaint/brush.h>
#include <texpaint/config.h>
#include <texpaint/logger.h>
#include <texpaint/texture.h>

namespace texpaint {

struct Scene_Object;

/**
 * \brief The paint layer of a single object.
 *
 * The paint buffer is the pixel store of `texture()`; that texture replaces
 * the material's map while the paint layer exists.
 */
class TEXPAINT_EXPORT Paint_Texture {
public:
    Paint_Texture(
        std::shared_ptr<Texture> &&texture,
        std::shared_ptr<Texture> const &original_map,
        Color const &original_color);

    Paint_Texture(Paint_Texture const &) = delete;
    void operator=(Paint_Texture const &) = delete;

    std::shared_ptr<Texture> const &texture() const noexcept {
        return _texture;
    }

    Pixel_View buffer() {
        return _texture->view();
    }

    unsigned width() const noexcept {
        return _texture->width();
    }

    unsigned height() const noexcept {
        return _texture->height();
    }

    std::shared_ptr<Texture> const &original_map() const noexcept {
        return _original_map;
    }

    Color const &original_color() const noexcept {
        return _original_color;
    }

    // Whether the base image is still being decoded
    bool base_layer_pending() const noexcept {
        return _pending_base.has_value();
    }

private:
    friend class Paint_Texture_Manager;

    std::shared_ptr<Texture> _texture;
    std::shared_ptr<Texture> _original_map;
    Color _original_color;

    std::optional<std::future<std::optional<Image>>> _pending_base;
};

/**
 * \brief Creates, updates and clears paint layers.
 *
 * Targets without a material or without geometry are not paintable; every
 * operation on them is a no-op.
 */
class TEXPAINT_EXPORT Paint_Texture_Manager {
public:
    Paint_Texture_Manager(Config const &config, ILogger *logger);
    ~Paint_Texture_Manager();

    Paint_Texture_Manager(Paint_Texture_Manager const &) = delete;
    void operator=(Paint_Texture_Manager const &) = delete;

    /**
     * Returns the paint layer of the target, creating it if needed.
     *
     * On creation the material's base texture (if any) becomes the bottom
     * layer of the buffer. Decoded textures are drawn immediately, encoded
     * ones are decoded in the background; see wait_for_base_layer().
     *
     * \return The paint layer or nullptr if the target isn't paintable.
     * \throws texpaint::Exception(Status::Out_Of_Memory) if the paint buffer
     * can't be allocated.
     */
    Paint_Texture *ensure(Scene_Object *target);

    /**
     * \return The paint layer of the target or nullptr.
     */
    Paint_Texture *find(Scene_Object const *target) const;

    /**
     * Blocks until the base image of the target's paint layer is decoded and
     * drawn into the buffer. Returns immediately if nothing is pending.
     */
    void wait_for_base_layer(Scene_Object *target);

    /**
     * Finishes a completed base image decode without blocking.
     * \return Whether the buffer changed.
     */
    bool poll(Scene_Object *target);

    /**
     * Flags the bound texture for re-upload. Idempotent.
     */
    void mark_dirty(Scene_Object *target);

    /**
     * Restores the original map and base color of the material and discards
     * the paint layer. No-op if the target has no paint layer.
     */
    void clear(Scene_Object *target);

    /**
     * Writes the paint buffer of the target into a PNG file.
     */
    TEXPAINT_RETURN_CODE export_png(Scene_Object const *target, char const *path);

private:
    void finish_base_layer(Paint_Texture *paint);
    void draw_base_layer(Paint_Texture *paint, Const_Pixel_View const &base);

    Config _config;
    ILogger *_logger;
    boost::asio::thread_pool _decode_pool;
};

}
