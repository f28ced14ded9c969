// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose:
//

#pragma once

#include <memory>
#include <string>
#include <texpaint/brush.h>
#include "sdl_window.h"

struct Demo_Options {
    // Image file drawn below the paint; may be empty
    std::string base_path;
    unsigned width = 1024;
    unsigned height = 1024;
    bool flat_canvas = false;
    bool verbose = false;
    // Initial brush
    texpaint::Brush_Settings brush;
};

class IApplication {
public:
    virtual ~IApplication() = default;

    virtual int run() = 0;
};

/**
 * Creates the paint demo application.
 * \throws texpaint::Exception if the paint engine can't be created
 */
std::unique_ptr<IApplication> make_application(
    std::unique_ptr<sdl::Window> &&window,
    Demo_Options const &options
);
