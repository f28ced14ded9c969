// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: texture object shared between the engine and the renderer
//

#include "stdafx.h"
#include <texpaint/texture.h>

namespace gil = boost::gil;

namespace texpaint {

Texture::Texture(unsigned width, unsigned height)
    : _image(width, height) {
    gil::fill_pixels(gil::view(_image), Pixel(0, 0, 0, 0));
    _needs_update = true;
}

std::shared_ptr<Texture> Texture::from_encoded(std::vector<uint8_t> &&data) {
    std::shared_ptr<Texture> ret(new Texture());
    ret->_encoded = std::move(data);
    return ret;
}

}
