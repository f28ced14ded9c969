// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose:
//

#include "stdafx.h"
#include "application.h"
#include "demo_scene.h"

#include <fstream>
#include <iterator>

#include <stb_image.h>

#define EXPORT_PATH "paint.png"

using namespace texpaint;

static std::optional<std::vector<uint8_t>> read_file(char const *path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return std::nullopt;
    }

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Decodes the base image for display until the paint layer takes over
static std::shared_ptr<Texture> decode_preview(std::vector<uint8_t> const &data) {
    int width, height, channels;
    auto pixels = stbi_load_from_memory(data.data(), int(data.size()), &width, &height, &channels, 4);
    if (pixels == nullptr) {
        fprintf(stderr, "Couldn't decode the base image: %s\n", stbi_failure_reason());
        return nullptr;
    }

    auto ret = std::make_shared<Texture>(width, height);
    auto src = boost::gil::interleaved_view(width, height, (Pixel const *)pixels, width * 4);
    boost::gil::copy_pixels(src, ret->view());
    stbi_image_free(pixels);

    return ret;
}

/*
 * Handlers are offered each SDL event in order until one consumes it
 */
class IEvent_Handler {
public:
    virtual ~IEvent_Handler() = default;

    virtual bool on_event(SDL_Event const &ev) = 0;
};

static Pointer_Button to_pointer_button(Uint8 button) {
    switch (button) {
    case SDL_BUTTON_RIGHT: return Pointer_Button::Secondary;
    case SDL_BUTTON_MIDDLE: return Pointer_Button::Middle;
    default: return Pointer_Button::Primary;
    }
}

/*
 * Translates mouse events into pointer events
 */
class Pointer_Event_Handler : public IEvent_Handler {
public:
    Pointer_Event_Handler(IPaint_Engine *engine) : _engine(engine) {
    }

    bool on_event(SDL_Event const &ev) override {
        Pointer_Event pev;

        switch (ev.type) {
        case SDL_MOUSEBUTTONDOWN:
            pev.type = Pointer_Event_Type::Down;
            pev.position = glm::vec2(float(ev.button.x), float(ev.button.y));
            pev.button = to_pointer_button(ev.button.button);
            break;
        case SDL_MOUSEBUTTONUP:
            pev.type = Pointer_Event_Type::Up;
            pev.position = glm::vec2(float(ev.button.x), float(ev.button.y));
            pev.button = to_pointer_button(ev.button.button);
            break;
        case SDL_MOUSEMOTION:
            pev.type = Pointer_Event_Type::Move;
            pev.position = glm::vec2(float(ev.motion.x), float(ev.motion.y));
            break;
        case SDL_WINDOWEVENT:
            if (ev.window.event != SDL_WINDOWEVENT_LEAVE) {
                return false;
            }
            pev.type = Pointer_Event_Type::Leave;
            break;
        default:
            return false;
        }

        _engine->handle(pev);
        return true;
    }

private:
    IPaint_Engine *_engine;
};

/*
 * Brush and paint layer hotkeys
 */
class Key_Event_Handler : public IEvent_Handler {
public:
    Key_Event_Handler(Demo_Scene *scene, IPaint_Engine *engine, bool *quit)
        : _scene(scene), _engine(engine), _quit(quit) {
    }

    bool on_event(SDL_Event const &ev) override {
        if (ev.type != SDL_KEYDOWN) {
            return false;
        }

        auto &settings = _scene->settings;

        switch (ev.key.keysym.sym) {
        case SDLK_1: settings.type = Brush_Type::Round; break;
        case SDLK_2: settings.type = Brush_Type::Square; break;
        case SDLK_3: settings.type = Brush_Type::Airbrush; break;
        case SDLK_4: settings.type = Brush_Type::Stipple; break;
        case SDLK_5: settings.type = Brush_Type::Gradient; break;
        case SDLK_b:
            settings.blend_mode = Blend_Mode((int(settings.blend_mode) + 1) % (int(Blend_Mode::Color_Burn) + 1));
            break;
        case SDLK_LEFTBRACKET:
            settings = step_brush_size(settings, -5);
            break;
        case SDLK_RIGHTBRACKET:
            settings = step_brush_size(settings, +5);
            break;
        case SDLK_x:
            std::swap(settings.primary_color, settings.secondary_color);
            break;
        case SDLK_l:
            _scene->toggle_lock();
            break;
        case SDLK_p:
            _scene->painting = !_scene->painting;
            break;
        case SDLK_c:
            _engine->clear_paint(&_scene->object);
            break;
        case SDLK_e: {
            auto rc = _engine->export_paint(&_scene->object, EXPORT_PATH);
            if (rc != Status::OK) {
                fprintf(stderr, "Export has failed: %s\n", to_string(rc));
            }
            break;
        }
        case SDLK_ESCAPE:
            *_quit = true;
            break;
        default:
            return false;
        }

        return true;
    }

private:
    Demo_Scene *_scene;
    IPaint_Engine *_engine;
    bool *_quit;
};

class Application : public IApplication {
public:
    Application(
        std::unique_ptr<sdl::Window> &&window,
        std::unique_ptr<Demo_Scene> &&scene,
        std::shared_ptr<Texture> &&preview,
        Config const &config) :
    _window(std::move(window)),
    _scene(std::move(scene)),
    _preview(std::move(preview)),
    _engine(make_paint_engine(config, _scene.get())),
    _pointer_ev_handler(_engine.get()),
    _key_ev_handler(_scene.get(), _engine.get(), &_quit) {
    }

    int run() override {
        SDL_Event ev;
        IEvent_Handler *handlers[] = { &_key_ev_handler, &_pointer_ev_handler };

        while (!_quit) {
            while (SDL_PollEvent(&ev)) {
                auto consumed = std::any_of(
                    std::begin(handlers), std::end(handlers),
                    [&](IEvent_Handler *h) { return h->on_event(ev); });

                if (!consumed && ev.type == SDL_QUIT) {
                    _quit = true;
                }
            }

            _engine->poll();

            SDL_SetRenderDrawColor(*_window, 48, 48, 48, 255);
            SDL_RenderClear(*_window);

            auto texture = current_texture();
            if (texture != nullptr && upload(texture)) {
                SDL_RenderCopy(*_window, *_canvas, NULL, NULL);
            }

            draw_cursor(_engine->cursor());
            update_title();

            SDL_RenderPresent(*_window);
        }

        return 0;
    }

private:
    Texture *current_texture() {
        auto paint = _engine->paint_texture(&_scene->object);
        if (paint != nullptr) {
            return paint->texture().get();
        }

        return _preview.get();
    }

    bool upload(Texture *texture) {
        if (!texture->has_pixels()) {
            return false;
        }

        auto width = int(texture->width());
        auto height = int(texture->height());
        if (!_canvas || _canvas->width != width || _canvas->height != height) {
            _canvas = std::make_unique<sdl::Streaming_Texture>(*_window, width, height);
            if (!*_canvas) {
                fprintf(stderr, "Couldn't create the canvas texture: SDL_CreateTexture has failed: %s\n", SDL_GetError());
                _canvas.reset();
                return false;
            }
            _shown = nullptr;
        }

        if (texture != _shown || texture->needs_update()) {
            auto view = texture->const_view();
            auto pixels = boost::gil::interleaved_view_get_raw_data(view);
            if (!_canvas->update(pixels, int(view.pixels().row_size()))) {
                fprintf(stderr, "SDL_UpdateTexture has failed: %s\n", SDL_GetError());
                return false;
            }
            texture->clear_needs_update();
            _shown = texture;
        }

        return true;
    }

    void draw_cursor(Cursor_Indicator const &cursor) {
        SDL_Renderer *renderer = *_window;
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

        auto const &fill = cursor.fill_color;
        auto const &border = cursor.border_color;
        auto half = cursor.size / 2;

        if (cursor.shape == Cursor_Shape::Square) {
            SDL_Rect rect = {
                int(cursor.center.x - half), int(cursor.center.y - half),
                int(cursor.size), int(cursor.size),
            };
            SDL_SetRenderDrawColor(renderer, Uint8(fill.r * 255), Uint8(fill.g * 255), Uint8(fill.b * 255), Uint8(fill.a * 255));
            SDL_RenderFillRect(renderer, &rect);
            SDL_SetRenderDrawColor(renderer, Uint8(border.r * 255), Uint8(border.g * 255), Uint8(border.b * 255), Uint8(border.a * 255));
            SDL_RenderDrawRect(renderer, &rect);
        } else {
            constexpr int segments = 48;
            SDL_Point points[segments + 1];
            for (int i = 0; i <= segments; i++) {
                auto phi = i * glm::two_pi<float>() / segments;
                points[i].x = int(cursor.center.x + half * glm::cos(phi));
                points[i].y = int(cursor.center.y + half * glm::sin(phi));
            }
            SDL_SetRenderDrawColor(renderer, Uint8(border.r * 255), Uint8(border.g * 255), Uint8(border.b * 255), Uint8(border.a * 255));
            SDL_RenderDrawLines(renderer, points, segments + 1);
        }
    }

    void update_title() {
        auto const &settings = _scene->settings;
        char buf[256];
        snprintf(buf, 256, "Texture paint - %s, %s, %s, size %d%s%s%s",
            to_string(settings.type),
            to_string(settings.blend_mode),
            to_hex_string(settings.primary_color).c_str(),
            int(settings.size),
            _scene->painting ? "" : " [paint off]",
            _scene->is_locked(_scene->object.id) ? " [locked]" : "",
            _engine->state() == Session_State::Dragging ? " *" : "");
        if (_title != buf) {
            _title = buf;
            SDL_SetWindowTitle(*_window, buf);
        }
    }

private:
    bool _quit = false;

    std::unique_ptr<sdl::Window> _window;
    std::unique_ptr<Demo_Scene> _scene;
    std::shared_ptr<Texture> _preview;
    std::unique_ptr<IPaint_Engine> _engine;

    Pointer_Event_Handler _pointer_ev_handler;
    Key_Event_Handler _key_ev_handler;

    std::unique_ptr<sdl::Streaming_Texture> _canvas;
    Texture *_shown = nullptr;
    std::string _title;
};

std::unique_ptr<IApplication> make_application(
    std::unique_ptr<sdl::Window> &&window,
    Demo_Options const &options
) {
    Config config;
    config.buffer_width = options.width;
    config.buffer_height = options.height;
    config.projection = options.flat_canvas ? Projection_Mode::Flat_Canvas : Projection_Mode::Surface;
    config.log_level = options.verbose ? Severity::Debug : Severity::Info;

    auto scene = std::make_unique<Demo_Scene>(options.width, options.height);
    scene->settings = options.brush;
    std::shared_ptr<Texture> preview;

    if (!options.base_path.empty()) {
        auto data = read_file(options.base_path.c_str());
        if (data) {
            preview = decode_preview(*data);
            // The engine decodes its own copy in the background
            scene->object.material->map = Texture::from_encoded(std::move(*data));
        } else {
            fprintf(stderr, "Couldn't read '%s'\n", options.base_path.c_str());
        }
    }

    return std::make_unique<Application>(
        std::move(window),
        std::move(scene),
        std::move(preview),
        config
    );
}
