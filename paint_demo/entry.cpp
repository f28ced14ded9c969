// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose:
//

#include "stdafx.h"
#include "application.h"
#include <cstdio>
#include <cstring>

static void print_usage(char const *argv0) {
    fprintf(stderr, "Usage: %s [-s WIDTHxHEIGHT] [-f] [-v] [-t brush] [-b blend-mode] [-c color] [base-image]\n", argv0);
    fprintf(stderr, "  -s  paint buffer and window size (default 1024x1024)\n");
    fprintf(stderr, "  -t  round, square, airbrush, stipple or gradient\n");
    fprintf(stderr, "  -b  normal, multiply, screen, overlay, soft-light, hard-light,\n");
    fprintf(stderr, "      color-dodge or color-burn\n");
    fprintf(stderr, "  -c  primary color as #rgb, #rrggbb or #rrggbbaa\n");
    fprintf(stderr, "  -f  flat canvas mode\n");
    fprintf(stderr, "  -v  log debug messages\n");
    fprintf(stderr, "Keys: 1-5 brush, B blend mode, [ ] size, X swap colors,\n");
    fprintf(stderr, "      L lock, P paint mode, C clear, E export, Esc quit\n");
}

static bool parse_options(Demo_Options &opts, int argc, char **argv) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-s") == 0) {
            if (i + 1 >= argc) {
                return false;
            }
            i++;
            if (sscanf(argv[i], "%ux%u", &opts.width, &opts.height) != 2) {
                return false;
            }
        } else if (strcmp(argv[i], "-t") == 0) {
            if (i + 1 >= argc) {
                return false;
            }
            auto type = texpaint::brush_type_from_string(argv[++i]);
            if (!type) {
                fprintf(stderr, "Unknown brush '%s'\n", argv[i]);
                return false;
            }
            opts.brush.type = *type;
        } else if (strcmp(argv[i], "-b") == 0) {
            if (i + 1 >= argc) {
                return false;
            }
            // Unknown modes fall back to normal
            opts.brush.blend_mode = texpaint::blend_mode_from_string(argv[++i]);
        } else if (strcmp(argv[i], "-c") == 0) {
            if (i + 1 >= argc) {
                return false;
            }
            auto color = texpaint::parse_color(argv[++i]);
            if (!color) {
                fprintf(stderr, "Malformed color '%s'\n", argv[i]);
                return false;
            }
            opts.brush.primary_color = *color;
        } else if (strcmp(argv[i], "-f") == 0) {
            opts.flat_canvas = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            opts.verbose = true;
        } else if (argv[i][0] == '-') {
            return false;
        } else {
            opts.base_path = argv[i];
        }
    }

    return true;
}

int main(int argc, char **argv) {
    Demo_Options opts;
    if (!parse_options(opts, argc, argv)) {
        print_usage(argv[0]);
        return 1;
    }

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init has failed: %s\n", SDL_GetError());
        return 1;
    }

    int rc = 1;
    {
        auto wnd = std::make_unique<sdl::Window>("Texture paint", int(opts.width), int(opts.height));
        if (!*wnd) {
            fprintf(stderr, "Failed to create window: %s\n", SDL_GetError());
        } else {
            try {
                auto app = make_application(std::move(wnd), opts);
                rc = app->run();
            } catch (texpaint::Exception const &ex) {
                fprintf(stderr, "Couldn't create the paint engine: %s\n", ex.what());
            }
        }
    }

    SDL_Quit();
    return rc;
}
