// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: stb_image and stb_image_write implementation
//

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_write.h>
