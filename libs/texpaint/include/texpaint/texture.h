// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: texture object shared between the engine and the renderer
//

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <boost/gil.hpp>

#include <texpaint/status.h>

namespace texpaint {

using Pixel = boost::gil::rgba8_pixel_t;
using Image = boost::gil::rgba8_image_t;
using Pixel_View = boost::gil::rgba8_view_t;
using Const_Pixel_View = boost::gil::rgba8c_view_t;

/**
 * \brief A texture the renderer samples from.
 *
 * Either holds RGBA8 pixels, or the encoded image file (PNG, JPEG, ...) it
 * was loaded from and will be decoded on demand, or both.
 */
class TEXPAINT_EXPORT Texture {
public:
    /**
     * Allocates a transparent texture.
     * Throws std::bad_alloc if the pixels can't be allocated.
     */
    Texture(unsigned width, unsigned height);

    /**
     * Wraps an encoded image. Pixels are not available until someone
     * decodes it.
     */
    static std::shared_ptr<Texture> from_encoded(std::vector<uint8_t> &&data);

    Texture(Texture const &) = delete;
    void operator=(Texture const &) = delete;

    unsigned width() const noexcept {
        return unsigned(_image.width());
    }

    unsigned height() const noexcept {
        return unsigned(_image.height());
    }

    bool has_pixels() const noexcept {
        return _image.width() > 0 && _image.height() > 0;
    }

    Pixel_View view() {
        return boost::gil::view(_image);
    }

    Const_Pixel_View const_view() const {
        return boost::gil::const_view(_image);
    }

    std::vector<uint8_t> const &encoded() const noexcept {
        return _encoded;
    }

    // Flags the texture for re-upload. Redundant marks are free.
    void mark_dirty() noexcept {
        _needs_update = true;
    }

    bool needs_update() const noexcept {
        return _needs_update;
    }

    // Called by the renderer once it has uploaded the current pixels.
    void clear_needs_update() noexcept {
        _needs_update = false;
    }

private:
    Texture() = default;

    Image _image;
    std::vector<uint8_t> _encoded;
    bool _needs_update = false;
};

}
