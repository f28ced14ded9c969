// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: SDL window, renderer and texture wrappers
//

#pragma once

#include <SDL.h>

namespace sdl {
    struct Window {
        SDL_Window *window = nullptr;
        SDL_Renderer *renderer = nullptr;
        int const width;
        int const height;

        Window(const char *title, int w, int h)
            : width(w), height(h) {
            window = SDL_CreateWindow(
                title,
                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                w, h,
                SDL_WINDOW_SHOWN
            );
            if (window != NULL) {
                renderer = SDL_CreateRenderer(
                    window, -1,
                    SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC
                );
            }
        }

        ~Window() {
            if (renderer) {
                SDL_DestroyRenderer(renderer);
            }
            if (window) {
                SDL_DestroyWindow(window);
            }
        }

        Window(Window const &) = delete;
        void operator=(Window const &) = delete;

        operator bool() const { return window != NULL && renderer != NULL; }

        operator SDL_Window *() const { return window; }
        operator SDL_Renderer *() const { return renderer; }
    };

    // RGBA8 texture updated from CPU memory
    struct Streaming_Texture {
        SDL_Texture *texture = nullptr;
        int const width;
        int const height;

        Streaming_Texture(SDL_Renderer *renderer, int w, int h)
            : width(w), height(h) {
            texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, w, h);
            if (texture != NULL) {
                SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND);
            }
        }

        ~Streaming_Texture() {
            if (texture) {
                SDL_DestroyTexture(texture);
            }
        }

        Streaming_Texture(Streaming_Texture const &) = delete;
        void operator=(Streaming_Texture const &) = delete;

        bool update(void const *pixels, int pitch) {
            return SDL_UpdateTexture(texture, NULL, pixels, pitch) == 0;
        }

        operator bool() const { return texture != NULL; }
        operator SDL_Texture *() const { return texture; }
    };
}
