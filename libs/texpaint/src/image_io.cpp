// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: image file decoding and encoding
//

#include "stdafx.h"
#include "image_io.h"

#include <stb_image.h>
#include <stb_image_write.h>

namespace gil = boost::gil;

namespace texpaint {

std::optional<Image> decode_image(std::vector<uint8_t> const &data) {
    ZoneScoped;
    if (data.empty() || data.size() > size_t(INT32_MAX)) {
        return std::nullopt;
    }

    int width, height, channels;
    auto buffer = stbi_load_from_memory(data.data(), int(data.size()), &width, &height, &channels, 4);
    if (buffer == nullptr) {
        return std::nullopt;
    }

    auto src = gil::interleaved_view(width, height, (Pixel const *)buffer, ptrdiff_t(width) * 4);
    Image ret(width, height);
    gil::copy_pixels(src, gil::view(ret));
    stbi_image_free(buffer);

    return ret;
}

bool write_png(char const *path, Const_Pixel_View const &pixels) {
    ZoneScoped;
    if (path == nullptr) {
        return false;
    }

    auto width = int(pixels.width());
    auto height = int(pixels.height());
    auto stride = ptrdiff_t(width) * 4;

    // The view may not be contiguous
    std::vector<uint8_t> buffer(size_t(stride) * size_t(height));
    auto dst = gil::interleaved_view(width, height, (Pixel *)buffer.data(), stride);
    gil::copy_pixels(pixels, dst);

    return stbi_write_png(path, width, height, 4, buffer.data(), int(stride)) != 0;
}

}
