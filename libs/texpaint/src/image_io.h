// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: image file decoding and encoding
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <texpaint/texture.h>

namespace texpaint {
    // Decodes an image file (PNG, JPEG, BMP, TGA, ...) held in memory into
    // RGBA8 pixels. Returns std::nullopt if the data can't be decoded.
    std::optional<Image> decode_image(std::vector<uint8_t> const &data);

    // Writes the pixels into a PNG file. Returns false on failure.
    bool write_png(char const *path, Const_Pixel_View const &pixels);
}
